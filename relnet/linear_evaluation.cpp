// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#include "linear_evaluation.h"

#include <dlib/global_optimization.h>
#include <algorithm>
#include <iostream>
#include <thread>

namespace relnet
{
    using namespace dlib;

    namespace
    {
        svm_multiclass_linear_trainer<linear_kernel<feature_vector>, unsigned long> make_trainer(
            const linear_evaluation_options& options,
            const double c
        )
        {
            svm_multiclass_linear_trainer<linear_kernel<feature_vector>, unsigned long> trainer;
            trainer.set_c(c);
            trainer.set_epsilon(options.epsilon);
            trainer.set_max_iterations(options.max_iterations);
            trainer.set_num_threads(std::max(1u, std::thread::hardware_concurrency()));
            return trainer;
        }
    }

    linear_model train_linear_model(
        std::vector<feature_vector> features,
        const std::vector<unsigned long>& labels,
        const linear_evaluation_options& options
    )
    {
        DLIB_CASSERT(features.size() == labels.size());

        linear_model model;
        model.normalizer.train(features);
        for (auto& feature : features)
            feature = model.normalizer(feature);

        model.c = options.c;
        if (model.c <= 0)
        {
            // Find the most appropriate C setting using find_max_global.
            auto cross_validation_score = [&](const double c)
            {
                auto trainer = make_trainer(options, c);
                const auto cm = cross_validate_multiclass_trainer(trainer, features, labels, options.folds);
                const double accuracy = sum(diag(cm)) / sum(cm);
                if (options.verbose)
                    std::cout << "C: " << c << ", cross validation accuracy: " << accuracy << std::endl;
                return accuracy;
            };
            const auto best = find_max_global(cross_validation_score, options.min_c, options.max_c,
                max_function_calls(options.max_search_calls));
            model.c = best.x(0);
            if (options.verbose)
                std::cout << "Best SVM hyperparameter C: " << model.c << std::endl;
        }

        model.df = make_trainer(options, model.c).train(features, labels);
        return model;
    }

    double classification_accuracy(
        const linear_model& model,
        const std::vector<feature_vector>& features,
        const std::vector<unsigned long>& labels
    )
    {
        DLIB_CASSERT(features.size() == labels.size() && !labels.empty());
        size_t num_right = 0;
        for (size_t i = 0; i < labels.size(); ++i)
        {
            if (labels[i] == model.df(model.normalizer(features[i])))
                ++num_right;
        }
        return num_right / static_cast<double>(labels.size());
    }
}
