// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#ifndef RELNET_LINEAR_EVALUATION_H_
#define RELNET_LINEAR_EVALUATION_H_

#include <dlib/matrix.h>
#include <dlib/pixel.h>
#include <dlib/svm_threaded.h>
#include <vector>

/*!
    Measures how good frozen backbone features are: a linear multiclass SVM is
    trained on the normalized features of the labelled training images and its
    accuracy is reported on both the training and the testing images.  The backbone
    is only read here.
!*/

namespace relnet
{
    using feature_vector = dlib::matrix<float, 0, 1>;
    using linear_classifier = dlib::multiclass_linear_decision_function<
        dlib::linear_kernel<feature_vector>, unsigned long>;

    struct linear_evaluation_options
    {
        // A value <= 0 searches C with find_max_global over cross-validation.
        double c = 0;
        double min_c = 1e-3;
        double max_c = 1000;
        size_t max_search_calls = 50;
        unsigned long folds = 3;
        double epsilon = 0.01;
        unsigned long max_iterations = 100;
        size_t extraction_batch_size = 256;
        bool verbose = false;
    };

    struct linear_evaluation_result
    {
        double c = 0;
        double training_accuracy = 0;
        double testing_accuracy = 0;
    };

    struct linear_model
    {
        dlib::vector_normalizer<feature_vector> normalizer;
        linear_classifier df;
        double c = 0;
    };

    linear_model train_linear_model(
        std::vector<feature_vector> features,
        const std::vector<unsigned long>& labels,
        const linear_evaluation_options& options
    );
    /*!
        requires
            - features.size() == labels.size() and both hold at least two classes.
        ensures
            - fits the normalizer on features, then trains the SVM on the normalized
              features with options.c, or with the C found by the search.
    !*/

    double classification_accuracy(
        const linear_model& model,
        const std::vector<feature_vector>& features,
        const std::vector<unsigned long>& labels
    );

    template <typename extractor_type>
    linear_evaluation_result evaluate_linear(
        extractor_type& extractor,
        const std::vector<dlib::matrix<dlib::rgb_pixel>>& training_images,
        const std::vector<unsigned long>& training_labels,
        const std::vector<dlib::matrix<dlib::rgb_pixel>>& testing_images,
        const std::vector<unsigned long>& testing_labels,
        const linear_evaluation_options& options = linear_evaluation_options()
    )
    {
        linear_evaluation_result result;
        auto features = extractor(training_images, options.extraction_batch_size);
        const auto model = train_linear_model(features, training_labels, options);
        result.c = model.c;
        result.training_accuracy = classification_accuracy(model, features, training_labels);

        features = extractor(testing_images, options.extraction_batch_size);
        result.testing_accuracy = classification_accuracy(model, features, testing_labels);
        return result;
    }
}

#endif // RELNET_LINEAR_EVALUATION_H_
