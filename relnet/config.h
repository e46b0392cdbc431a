// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#ifndef RELNET_CONFIG_H_
#define RELNET_CONFIG_H_

#include <cstddef>
#include <iosfwd>

namespace relnet
{
    /*!
        WHAT THIS OBJECT REPRESENTS
            The values that drive one self-supervised relational reasoning run.

            - num_views:     K, the number of augmented views drawn per image.  Training
                             needs at least two, otherwise no relation pair exists.
            - batch_size:    B, the number of source images per mini-batch.  One forward
                             pass of the backbone sees K*B images.
            - tot_epochs:    number of passes over the image source.
            - feature_size:  F, the dimensionality of one backbone feature vector.
            - learning_rate: step size given to the adam solvers of both networks.
            - seed:          seed of the generator owned by the sampler.
            - print_every:   progress is printed every print_every batches.
            - prefetch_depth: capacity of the background view batch queue.
    !*/
    struct relation_config
    {
        long num_views = 4;
        size_t batch_size = 64;
        size_t tot_epochs = 10;
        long feature_size = 64;
        double learning_rate = 1e-3;
        unsigned long seed = 0;
        size_t print_every = 100;
        size_t prefetch_depth = 4;

        void validate() const;
        /*!
            ensures
                - returns normally if this configuration can drive a training run.
            throws
                - config_error naming the first offending value otherwise.
        !*/
    };

    std::ostream& operator<<(std::ostream& out, const relation_config& item);
}

#endif // RELNET_CONFIG_H_
