// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#ifndef RELNET_MULTIVIEW_SAMPLER_H_
#define RELNET_MULTIVIEW_SAMPLER_H_

#include "augmentation.h"

#include <dlib/matrix.h>
#include <dlib/pipe.h>
#include <dlib/pixel.h>
#include <dlib/rand.h>
#include <exception>
#include <thread>
#include <vector>

namespace relnet
{
    struct multiview_sample
    {
        std::vector<dlib::matrix<dlib::rgb_pixel>> views;
        unsigned long label = 0;
    };

    /*!
        WHAT THIS OBJECT REPRESENTS
            The views of one mini-batch, laid out as num_views consecutive blocks of
            batch_size images.  images[v*batch_size + a] is the v-th view of the a-th
            image of the batch.  labels holds one label per image and is never used
            for training.
    !*/
    struct view_batch
    {
        long num_views = 0;
        long batch_size = 0;
        std::vector<dlib::matrix<dlib::rgb_pixel>> images;
        std::vector<unsigned long> labels;
    };

    view_batch make_view_batch(
        const std::vector<multiview_sample>& samples
    );
    /*!
        ensures
            - returns the samples flattened into the view block layout.
        throws
            - degenerate_batch_error if samples is empty or if the samples don't all
              have the same, non-zero, number of views.
    !*/

    class multiview_sampler
    {
        /*!
            WHAT THIS OBJECT REPRESENTS
                Wraps an in-memory image collection and hands out, for a given index,
                num_views() independently augmented views of that image plus its label.

                All randomness, both for the augmentations and for shuffling epochs,
                comes from one dlib::rand owned by this object and seeded at
                construction.  Two samplers built with the same seed over the same
                images return identical views for the same sequence of calls.

                The images and labels are referenced, not copied, and must outlive
                the sampler.  The sampler is not thread safe.
        !*/
    public:
        multiview_sampler(
            const std::vector<dlib::matrix<dlib::rgb_pixel>>& images,
            const std::vector<unsigned long>& labels,
            long num_views,
            augmentation_function augment,
            unsigned long seed
        );
        /*!
            throws
                - config_error if num_views < 1, if augment is empty or if images and
                  labels differ in length.
        !*/

        multiview_sampler(
            const std::vector<dlib::matrix<dlib::rgb_pixel>>& images,
            const std::vector<unsigned long>& labels,
            unsigned long seed
        );
        /*!
            ensures
                - builds a sampler without augmentation.  sample() returns the raw
                  image as the single view and #num_views() == 1.
        !*/

        size_t size() const { return images.size(); }
        long num_views() const { return views; }
        bool has_augmentation() const { return static_cast<bool>(augment); }

        multiview_sample sample(
            size_t index
        );
        /*!
            ensures
                - returns num_views() views of image index, each drawn with its own
                  call to the augmentation, and label index.
            throws
                - dlib::error if index >= size().
                - any exception thrown by the augmentation, unchanged.
        !*/

        view_batch sample_batch(
            const std::vector<size_t>& indices
        );

        std::vector<std::vector<size_t>> epoch_batches(
            size_t batch_size
        );
        /*!
            requires
                - batch_size > 0
            ensures
                - shuffles all indices and cuts them into size()/batch_size batches of
                  batch_size distinct indices.  The indices left over at the end are
                  dropped so every batch splits evenly into view blocks.
        !*/

    private:
        const std::vector<dlib::matrix<dlib::rgb_pixel>>& images;
        const std::vector<unsigned long>& labels;
        long views;
        augmentation_function augment;
        dlib::rand rnd;
    };

// ----------------------------------------------------------------------------------------

    class view_batch_loader
    {
        /*!
            WHAT THIS OBJECT REPRESENTS
                Prepares view batches on a background thread, tot_epochs passes over
                the sampler, so augmentation overlaps with training.  Batches come
                out in the same order, with the same random draws, as calling
                epoch_batches() and sample_batch() on the sampler directly.

                The sampler belongs to the loader thread while the loader is alive.
        !*/
    public:
        struct loaded_batch
        {
            size_t epoch = 0;
            size_t index = 0;
            bool last = false;
            view_batch batch;
        };

        view_batch_loader(
            multiview_sampler& sampler,
            size_t batch_size,
            size_t tot_epochs,
            size_t queue_depth
        );

        ~view_batch_loader();

        view_batch_loader(const view_batch_loader&) = delete;
        view_batch_loader& operator=(const view_batch_loader&) = delete;

        size_t batches_per_epoch() const { return num_batches; }

        bool dequeue(
            loaded_batch& item
        );
        /*!
            ensures
                - if a batch remains then #item is the next one and returns true.
                - returns false once every epoch has been handed out.
            throws
                - rethrows any exception the loader thread hit while sampling.
        !*/

    private:
        void thread();

        multiview_sampler& sampler;
        const size_t batch_size;
        const size_t tot_epochs;
        const size_t num_batches;
        dlib::pipe<loaded_batch> data;
        std::exception_ptr error;
        bool finished = false;
        std::thread worker;
    };
}

#endif // RELNET_MULTIVIEW_SAMPLER_H_
