// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#include <gtest/gtest.h>

#include "relnet/errors.h"
#include "relnet/relation_pairs.h"

#include <dlib/dnn.h>
#include <dlib/rand.h>
#include <algorithm>
#include <vector>

namespace relnet
{
    namespace
    {
        dlib::resizable_tensor make_features(const std::vector<float>& values, long rows, long dims)
        {
            dlib::resizable_tensor t(rows, dims);
            std::copy(values.begin(), values.end(), t.host());
            return t;
        }

        dlib::resizable_tensor random_features(long rows, long dims, dlib::rand& rnd)
        {
            dlib::resizable_tensor t(rows, dims);
            for (auto& v : t)
                v = rnd.get_random_gaussian();
            return t;
        }

        // Rotation applied to the right block of the negative pairs starting at n.
        long shift_of(const relation_plan& plan, size_t n)
        {
            const long b = plan.block_size();
            const long right_offset = plan.pairs()[n].right % b;
            return (b - right_offset) % b;
        }
    }

    TEST(RelationPairs, TwoViewsOfTwoImages)
    {
        // view 0 = [1, 2], view 1 = [10, 20]
        const auto features = make_features({1, 2, 10, 20}, 4, 1);
        dlib::resizable_tensor pairs;
        std::vector<float> targets;
        aggregate(features, 2, pairs, targets);

        ASSERT_EQ(pairs.num_samples(), 4);
        ASSERT_EQ(pairs.k(), 2);
        const std::vector<float> expected = {1, 10, 2, 20, 1, 20, 2, 10};
        EXPECT_EQ(std::vector<float>(pairs.begin(), pairs.end()), expected);
        EXPECT_EQ(targets, (std::vector<float>{1, 1, 0, 0}));
    }

    TEST(RelationPairs, CountAndBalance)
    {
        for (long k = 2; k <= 6; ++k)
        {
            for (long b = 2; b <= 7; ++b)
            {
                const relation_plan plan(k, b);
                const size_t expected = 2 * b * k * (k - 1) / 2;
                EXPECT_EQ(plan.size(), expected) << "K=" << k << " B=" << b;
                EXPECT_EQ(plan.targets().size(), expected);
                EXPECT_EQ(plan.num_positive(), expected / 2);

                size_t ones = 0;
                for (auto t : plan.targets())
                    ones += (t == 1.0f);
                EXPECT_EQ(ones, expected / 2);
            }
        }
    }

    TEST(RelationPairs, PositivePairsNeverMixImages)
    {
        const long k = 4, b = 5;
        const relation_plan plan(k, b);
        for (size_t n = 0; n < plan.size(); ++n)
        {
            if (plan.targets()[n] != 1.0f)
                continue;
            const auto& p = plan.pairs()[n];
            EXPECT_EQ(p.left % b, p.right % b);
            EXPECT_LT(p.left / b, p.right / b);
        }
    }

    TEST(RelationPairs, NegativePairsAreNeverAligned)
    {
        for (long k = 2; k <= 6; ++k)
        {
            for (long b = 2; b <= 9; ++b)
            {
                const relation_plan plan(k, b);
                for (size_t n = 0; n < plan.size(); ++n)
                {
                    if (plan.targets()[n] != 0.0f)
                        continue;
                    const auto& p = plan.pairs()[n];
                    EXPECT_NE(p.left % b, p.right % b) << "K=" << k << " B=" << b << " pair " << n;
                    EXPECT_LT(p.left / b, p.right / b);
                }
            }
        }
    }

    TEST(RelationPairs, EmissionOrder)
    {
        const long k = 3, b = 4;
        const relation_plan plan(k, b);
        // block pairs (0,1), (0,2), (1,2), each as B positives then B negatives
        const std::vector<std::pair<long, long>> blocks = {{0, 1}, {0, 2}, {1, 2}};
        size_t n = 0;
        for (const auto& ij : blocks)
        {
            for (long target = 1; target >= 0; --target)
            {
                for (long a = 0; a < b; ++a, ++n)
                {
                    EXPECT_EQ(plan.targets()[n], static_cast<float>(target));
                    EXPECT_EQ(plan.pairs()[n].left, static_cast<unsigned long>(ij.first * b + a));
                    EXPECT_EQ(plan.pairs()[n].right / b, static_cast<unsigned long>(ij.second));
                }
            }
        }
        EXPECT_EQ(n, plan.size());
    }

    TEST(RelationPairs, ShiftCounterWrapsToOne)
    {
        // four views, blocks of three images: shifts 1,2 then back to 1
        const long k = 4, b = 3;
        const relation_plan plan(k, b);
        std::vector<long> shifts;
        for (size_t n = b; n < plan.size(); n += 2 * b)
            shifts.push_back(shift_of(plan, n));
        EXPECT_EQ(shifts, (std::vector<long>{1, 2, 1, 2, 1, 2}));

        // with enough images per block every view pair of view 0 gets its own shift
        const relation_plan wide(4, 8);
        std::vector<long> wide_shifts;
        for (size_t n = 8; n < 3 * 16; n += 16)
            wide_shifts.push_back(shift_of(wide, n));
        EXPECT_EQ(wide_shifts, (std::vector<long>{1, 2, 3}));
    }

    TEST(RelationPairs, ConcatenatedRowsMatchFeatures)
    {
        dlib::rand rnd(3);
        const long k = 3, b = 4, dims = 5;
        const auto features = random_features(k * b, dims, rnd);
        const relation_plan plan(k, b);
        dlib::resizable_tensor pairs;
        concatenate_pairs(features, plan, pairs);

        ASSERT_EQ(pairs.num_samples(), static_cast<long long>(plan.size()));
        ASSERT_EQ(pairs.k(), 2 * dims);
        const float* f = features.host();
        const float* out = pairs.host();
        for (size_t n = 0; n < plan.size(); ++n)
        {
            for (long d = 0; d < dims; ++d)
            {
                EXPECT_EQ(out[n * 2 * dims + d], f[plan.pairs()[n].left * dims + d]);
                EXPECT_EQ(out[n * 2 * dims + dims + d], f[plan.pairs()[n].right * dims + d]);
            }
        }
    }

    TEST(RelationPairs, Deterministic)
    {
        dlib::rand rnd(11);
        const auto features = random_features(4 * 6, 3, rnd);
        dlib::resizable_tensor first, second;
        std::vector<float> first_targets, second_targets;
        aggregate(features, 4, first, first_targets);
        aggregate(features, 4, second, second_targets);

        ASSERT_EQ(first.size(), second.size());
        EXPECT_TRUE(std::equal(first.begin(), first.end(), second.begin()));
        EXPECT_EQ(first_targets, second_targets);
    }

    TEST(RelationPairs, SingleViewGivesNoPairs)
    {
        const auto features = make_features({1, 2, 3}, 3, 1);
        dlib::resizable_tensor pairs;
        std::vector<float> targets = {1};
        aggregate(features, 1, pairs, targets);
        EXPECT_EQ(pairs.num_samples(), 0);
        EXPECT_TRUE(targets.empty());

        EXPECT_TRUE(relation_plan(1, 1).empty());
    }

    TEST(RelationPairs, RejectsDegenerateBatches)
    {
        // one image per block: the rotation can't move anything
        EXPECT_THROW(relation_plan(2, 1), degenerate_batch_error);
        EXPECT_THROW(relation_plan(0, 4), degenerate_batch_error);
        EXPECT_THROW(relation_plan(2, 0), degenerate_batch_error);

        dlib::resizable_tensor pairs;
        std::vector<float> targets;
        // 5 rows don't split into 2 blocks
        EXPECT_THROW(aggregate(make_features({1, 2, 3, 4, 5}, 5, 1), 2, pairs, targets), degenerate_batch_error);
        EXPECT_THROW(aggregate(make_features({1, 2}, 2, 1), 2, pairs, targets), degenerate_batch_error);
        EXPECT_THROW(aggregate(dlib::resizable_tensor(), 2, pairs, targets), degenerate_batch_error);
    }

    TEST(RelationPairs, ScatterIsTheTransposeOfConcatenate)
    {
        dlib::rand rnd(5);
        const long k = 3, b = 3, dims = 4;
        const auto features = random_features(k * b, dims, rnd);
        const relation_plan plan(k, b);
        dlib::resizable_tensor pairs;
        concatenate_pairs(features, plan, pairs);

        const auto pair_gradients = random_features(pairs.num_samples(), 2 * dims, rnd);
        dlib::resizable_tensor feature_gradients;
        feature_gradients.copy_size(features);
        feature_gradients = 0;
        scatter_pair_gradients(pair_gradients, plan, feature_gradients);

        // <concat(x), g> == <x, scatter(g)>
        double lhs = 0, rhs = 0;
        for (size_t i = 0; i < pairs.size(); ++i)
            lhs += pairs.host()[i] * pair_gradients.host()[i];
        for (size_t i = 0; i < features.size(); ++i)
            rhs += features.host()[i] * feature_gradients.host()[i];
        EXPECT_NEAR(lhs, rhs, 1e-3);
    }

    TEST(RelationPairs, ScatterAccumulates)
    {
        const relation_plan plan(2, 2);
        dlib::resizable_tensor pair_gradients(plan.size(), 2);
        pair_gradients = 1;
        dlib::resizable_tensor feature_gradients(4, 1);
        feature_gradients = 10;
        scatter_pair_gradients(pair_gradients, plan, feature_gradients);

        // every row takes part in exactly two pairs here
        for (auto v : feature_gradients)
            EXPECT_EQ(v, 12);
    }

    TEST(RelationPairs, BinaryLabels)
    {
        const relation_plan plan(2, 3);
        const auto labels = plan.binary_labels();
        ASSERT_EQ(labels.size(), plan.size());
        for (size_t n = 0; n < labels.size(); ++n)
            EXPECT_EQ(labels[n], plan.targets()[n] == 1.0f ? 1.0f : -1.0f);
    }
}
