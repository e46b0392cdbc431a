// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#ifndef RELNET_RELATION_PAIRS_H_
#define RELNET_RELATION_PAIRS_H_

#include <dlib/dnn.h>
#include <vector>

/*!
    This module builds the relation pairs scored by the relation head.

    A feature batch holds K blocks of B rows.  Block v contains the features of the
    v-th augmented view of every image in the mini-batch, and all blocks list the
    images in the same order.  So rows v*B + a and w*B + a come from the same image
    for every pair of views v, w.

    For each pair of blocks (i, j) with i < j the aggregator emits:
        - B positive pairs: row i*B + a next to row j*B + a, target 1.
        - B negative pairs: row i*B + a next to row j*B + ((a - shift) mod B),
          target 0.  shift starts at 1, grows by one after every block pair and
          wraps back to 1 when it reaches B, so it is never 0.
    Positive pairs of a block pair are emitted before its negative pairs, and block
    pairs are visited with i in the outer loop and j in the inner loop, both
    ascending.  This yields 2*B*K*(K-1)/2 pairs, half of them positive.
!*/

namespace relnet
{
    // Rows of the feature batch that make up one relation pair.
    struct relation_pair
    {
        unsigned long left = 0;
        unsigned long right = 0;
    };

    inline bool operator==(const relation_pair& a, const relation_pair& b)
    {
        return a.left == b.left && a.right == b.right;
    }

    class relation_plan
    {
        /*!
            WHAT THIS OBJECT REPRESENTS
                The index layout of every relation pair for a feature batch of
                num_views() blocks of block_size() rows, in emission order, together
                with the parallel binary targets.  The plan depends only on the two
                sizes, so it is computed once and reused for every mini-batch.
        !*/
    public:
        relation_plan() = default;

        relation_plan(
            long num_views,
            long block_size
        );
        /*!
            ensures
                - #size() == 2*block_size*num_views*(num_views-1)/2
                - num_views == 1 yields an empty plan.
            throws
                - degenerate_batch_error if num_views < 1, block_size < 1, or if
                  block_size == 1 while num_views > 1.  A single row per block has
                  no non-identity rotation, so every negative pair would be a
                  positive pair.
        !*/

        long num_views() const { return views; }
        long block_size() const { return block; }
        size_t size() const { return pairs_.size(); }
        bool empty() const { return pairs_.empty(); }
        size_t num_positive() const { return positives; }

        const std::vector<relation_pair>& pairs() const { return pairs_; }
        const std::vector<float>& targets() const { return targets_; }

        // Labels in the +1/-1 convention used by dlib::loss_binary_log.
        std::vector<float> binary_labels() const;

    private:
        long views = 0;
        long block = 0;
        size_t positives = 0;
        std::vector<relation_pair> pairs_;
        std::vector<float> targets_;
    };

    long block_size_of(
        const dlib::tensor& features,
        long num_views
    );
    /*!
        ensures
            - returns features.num_samples()/num_views.
        throws
            - degenerate_batch_error if num_views < 1, if the batch is empty or if
              features.num_samples() is not a multiple of num_views.
    !*/

    void concatenate_pairs(
        const dlib::tensor& features,
        const relation_plan& plan,
        dlib::resizable_tensor& relation_pairs
    );
    /*!
        requires
            - features.num_samples() == plan.num_views()*plan.block_size()
        ensures
            - #relation_pairs.num_samples() == plan.size()
            - #relation_pairs.k() == 2*features.k()*features.nr()*features.nc()
            - row n of #relation_pairs is row plan.pairs()[n].left of features
              followed by row plan.pairs()[n].right.
    !*/

    void scatter_pair_gradients(
        const dlib::tensor& pair_gradients,
        const relation_plan& plan,
        dlib::tensor& feature_gradients
    );
    /*!
        requires
            - pair_gradients has the shape concatenate_pairs() gives relation_pairs.
            - feature_gradients has the shape of the features given to concatenate_pairs().
        ensures
            - adds the left half of every pair gradient row to feature row
              plan.pairs()[n].left and the right half to plan.pairs()[n].right.
              This is the transpose of concatenate_pairs().
    !*/

    void aggregate(
        const dlib::tensor& features,
        long num_views,
        dlib::resizable_tensor& relation_pairs,
        std::vector<float>& targets
    );
    /*!
        ensures
            - builds the relation_plan for features and writes its concatenated pairs
              to #relation_pairs and its targets (1 or 0) to #targets.
            - num_views == 1 gives an empty #relation_pairs and #targets.
        throws
            - degenerate_batch_error, see block_size_of() and relation_plan.
    !*/
}

#endif // RELNET_RELATION_PAIRS_H_
