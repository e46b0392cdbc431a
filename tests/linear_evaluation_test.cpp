// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#include <gtest/gtest.h>

#include "relnet/linear_evaluation.h"

#include <dlib/rand.h>
#include <vector>

namespace relnet
{
    namespace
    {
        using image = dlib::matrix<dlib::rgb_pixel>;

        // Stands in for a frozen backbone: the mean color of the image.
        struct mean_color_extractor
        {
            std::vector<feature_vector> operator()(const std::vector<image>& images, size_t)
            {
                std::vector<feature_vector> out;
                for (const auto& img : images)
                {
                    feature_vector f(3);
                    f = 0;
                    for (const auto& p : img)
                    {
                        f(0) += p.red;
                        f(1) += p.green;
                        f(2) += p.blue;
                    }
                    out.push_back(feature_vector(f / static_cast<float>(img.size())));
                }
                return out;
            }
        };

        // Three classes, each a noisy primary color.
        void make_colored_images(
            size_t per_class,
            dlib::rand& rnd,
            std::vector<image>& images,
            std::vector<unsigned long>& labels
        )
        {
            for (unsigned long label = 0; label < 3; ++label)
            {
                for (size_t i = 0; i < per_class; ++i)
                {
                    image img(8, 8);
                    for (auto& p : img)
                    {
                        const unsigned char noise = rnd.get_random_8bit_number() % 40;
                        p = dlib::rgb_pixel(noise, noise, noise);
                        if (label == 0) p.red = 200 + noise;
                        if (label == 1) p.green = 200 + noise;
                        if (label == 2) p.blue = 200 + noise;
                    }
                    images.push_back(img);
                    labels.push_back(label);
                }
            }
        }
    }

    TEST(LinearEvaluation, SeparableFeatures)
    {
        dlib::rand rnd(1);
        std::vector<image> training_images, testing_images;
        std::vector<unsigned long> training_labels, testing_labels;
        make_colored_images(20, rnd, training_images, training_labels);
        make_colored_images(10, rnd, testing_images, testing_labels);

        linear_evaluation_options options;
        options.c = 10;
        mean_color_extractor extractor;
        const auto result = evaluate_linear(extractor, training_images, training_labels,
            testing_images, testing_labels, options);

        EXPECT_EQ(result.c, 10);
        EXPECT_DOUBLE_EQ(result.training_accuracy, 1.0);
        EXPECT_DOUBLE_EQ(result.testing_accuracy, 1.0);
    }

    TEST(LinearEvaluation, SearchesC)
    {
        dlib::rand rnd(2);
        std::vector<image> images;
        std::vector<unsigned long> labels;
        make_colored_images(15, rnd, images, labels);

        linear_evaluation_options options;
        options.max_search_calls = 4;
        const auto model = train_linear_model(mean_color_extractor()(images, 0), labels, options);
        EXPECT_GE(model.c, options.min_c);
        EXPECT_LE(model.c, options.max_c);
        EXPECT_DOUBLE_EQ(classification_accuracy(model, mean_color_extractor()(images, 0), labels), 1.0);
    }
}
