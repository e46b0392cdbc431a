// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#include "relation_pairs.h"
#include "errors.h"

#include <algorithm>
#include <sstream>

namespace relnet
{
    using namespace dlib;

    relation_plan::relation_plan(
        long num_views,
        long block_size
    ) : views(num_views), block(block_size)
    {
        if (num_views < 1)
            throw degenerate_batch_error("relation_plan needs at least one view per image");
        if (block_size < 1)
            throw degenerate_batch_error("relation_plan needs at least one image per block");
        if (block_size == 1 && num_views > 1)
            throw degenerate_batch_error(
                "a block of one image can't form negative pairs, use a mini-batch of at least 2 images");

        const size_t block_pairs = static_cast<size_t>(num_views) * (num_views - 1) / 2;
        pairs_.reserve(2 * block_size * block_pairs);
        targets_.reserve(2 * block_size * block_pairs);

        long shift = 1;
        for (long i = 0; i < num_views; ++i)
        {
            const unsigned long first = i * block_size;
            for (long j = i + 1; j < num_views; ++j)
            {
                const unsigned long second = j * block_size;

                // Same offset in both blocks: two views of one image.
                for (long a = 0; a < block_size; ++a)
                {
                    relation_pair p;
                    p.left = first + a;
                    p.right = second + a;
                    pairs_.push_back(p);
                    targets_.push_back(1);
                }

                // Block j rolled down by shift rows, so row a meets image a - shift.
                for (long a = 0; a < block_size; ++a)
                {
                    relation_pair p;
                    p.left = first + a;
                    p.right = second + (a - shift + block_size) % block_size;
                    pairs_.push_back(p);
                    targets_.push_back(0);
                }

                ++shift;
                if (shift >= block_size)
                    shift = 1;
            }
        }
        positives = block_size * block_pairs;
    }

    std::vector<float> relation_plan::binary_labels() const
    {
        std::vector<float> labels(targets_.size());
        std::transform(targets_.begin(), targets_.end(), labels.begin(),
            [](float t) { return t > 0.5f ? +1.0f : -1.0f; });
        return labels;
    }

// ----------------------------------------------------------------------------------------

    long block_size_of(
        const tensor& features,
        long num_views
    )
    {
        if (num_views < 1)
            throw degenerate_batch_error("the number of views must be at least 1");
        if (features.num_samples() == 0)
            throw degenerate_batch_error("the feature batch is empty");
        if (features.num_samples() % num_views != 0)
        {
            std::ostringstream sout;
            sout << "a feature batch of " << features.num_samples()
                 << " rows can't be split into " << num_views << " equal view blocks";
            throw degenerate_batch_error(sout.str());
        }
        return features.num_samples() / num_views;
    }

    void concatenate_pairs(
        const tensor& features,
        const relation_plan& plan,
        resizable_tensor& relation_pairs
    )
    {
        DLIB_CASSERT(features.num_samples() == plan.num_views() * plan.block_size(),
            "features.num_samples(): " << features.num_samples()
            << ", plan rows: " << plan.num_views() * plan.block_size());

        const long dims = features.k() * features.nr() * features.nc();
        relation_pairs.set_size(plan.size(), 2 * dims);
        if (plan.empty())
            return;

        const float* in = features.host();
        float* out = relation_pairs.host_write_only();
        for (const auto& p : plan.pairs())
        {
            out = std::copy(in + p.left * dims, in + (p.left + 1) * dims, out);
            out = std::copy(in + p.right * dims, in + (p.right + 1) * dims, out);
        }
    }

    void scatter_pair_gradients(
        const tensor& pair_gradients,
        const relation_plan& plan,
        tensor& feature_gradients
    )
    {
        const long dims = feature_gradients.k() * feature_gradients.nr() * feature_gradients.nc();
        DLIB_CASSERT(feature_gradients.num_samples() == plan.num_views() * plan.block_size());
        DLIB_CASSERT(pair_gradients.num_samples() == static_cast<long long>(plan.size()));
        DLIB_CASSERT(pair_gradients.size() == plan.size() * 2 * dims);
        if (plan.empty())
            return;

        const float* g = pair_gradients.host();
        float* out = feature_gradients.host();
        for (const auto& p : plan.pairs())
        {
            float* left = out + p.left * dims;
            float* right = out + p.right * dims;
            for (long d = 0; d < dims; ++d)
                left[d] += g[d];
            for (long d = 0; d < dims; ++d)
                right[d] += g[dims + d];
            g += 2 * dims;
        }
    }

    void aggregate(
        const tensor& features,
        long num_views,
        resizable_tensor& relation_pairs,
        std::vector<float>& targets
    )
    {
        const relation_plan plan(num_views, block_size_of(features, num_views));
        concatenate_pairs(features, plan, relation_pairs);
        targets = plan.targets();
    }
}
