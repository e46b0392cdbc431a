// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
/*
    This is an example illustrating the use of the deep learning tools from the dlib C++
    Library together with relnet.  In this example program we are going to show how one
    can train a convolutional feature extractor without any label, using the
    self-supervised method called relational reasoning, introduced in this paper:
    "Self-Supervised Relational Reasoning for Representation Learning" by Massimiliano
    Patacchiola and Amos Storkey.

    Every image of a mini-batch is augmented K times.  All K*B views go through the
    backbone in a single pass, and every pair of views becomes a relation pair: two
    views of the same image make a positive pair, views of two different images make a
    negative pair.  A small relation head learns to tell them apart, and the backbone
    learns the features that make this possible.

    We will train a small conv4 backbone on the CIFAR-10 dataset, then freeze it and
    measure the quality of its features with a linear multiclass SVM, which is the only
    place where the labels are used.
*/

#include <dlib/cmd_line_parser.h>
#include <dlib/data_io.h>
#include <dlib/dnn.h>

#include "relnet/augmentation.h"
#include "relnet/config.h"
#include "relnet/linear_evaluation.h"
#include "relnet/models.h"
#include "relnet/multiview_sampler.h"
#include "relnet/persistence.h"
#include "relnet/relation_trainer.h"

using namespace std;
using namespace dlib;

#include <atomic>
#include <csignal>
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

// Define a cross-platform signal handling system
namespace {
    std::atomic<bool> g_terminate_flag(false);

#ifdef _WIN32
    // Windows-specific handler
    BOOL WINAPI console_ctrl_handler(DWORD ctrl_type) {
        if (ctrl_type == CTRL_C_EVENT) {
            g_terminate_flag.store(true);
            cout << "\nCtrl+C detected, stopping after the current step..." << endl;
            return TRUE;
        }
        return FALSE;
    }
#else
    // Unix/Linux/macOS handler
    void signal_handler(int signal) {
        if (signal == SIGINT) {
            g_terminate_flag.store(true);
            cout << "\nCtrl+C detected, stopping after the current step..." << endl;
        }
    }
#endif

    // Setup the interrupt handler based on platform
    void setup_interrupt_handler() {
#ifdef _WIN32
        if (!SetConsoleCtrlHandler(console_ctrl_handler, TRUE)) {
            cerr << "ERROR: Could not set control handler" << endl;
        }
#else
        struct sigaction sa;
        sa.sa_handler = signal_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, NULL);
#endif
    }
}

int main(const int argc, const char** argv)
try
{
    // Setup interrupt handling for clean termination
    setup_interrupt_handler();

    // The default settings are the ones of the paper for CIFAR-10.
    command_line_parser parser;
    parser.add_option("views", "set the number of augmentations per image, K (default: 4)", 1);
    parser.add_option("batch", "set the mini batch size, B (default: 64)", 1);
    parser.add_option("epochs", "set the number of training epochs (default: 10)", 1);
    parser.add_option("features", "set the backbone feature size (default: 64)", 1);
    parser.add_option("learning-rate", "set the adam learning rate (default: 1e-3)", 1);
    parser.add_option("seed", "seed the augmentations and the shuffling (default: 0)", 1);
    parser.add_option("print-every", "print the progress every N batches (default: 100)", 1);
    parser.add_option("model", "backbone file to write, or to read with --eval-only (default: relnet_conv4_cifar_10.dat)", 1);
    parser.add_option("svm-c", "use this C for the linear SVM instead of searching it", 1);
    parser.add_option("eval-only", "skip training and evaluate the saved backbone");
    parser.set_group_name("Help Options");
    parser.add_option("h", "alias for --help");
    parser.add_option("help", "display this message and exit");
    parser.parse(argc, argv);

    if (parser.number_of_arguments() < 1 || parser.option("h") || parser.option("help"))
    {
        cout << "This example needs the CIFAR-10 dataset to run." << endl;
        cout << "You can get CIFAR-10 from https://www.cs.toronto.edu/~kriz/cifar.html" << endl;
        cout << "Download the binary version the dataset, decompress it, and put the 6" << endl;
        cout << "bin files in a folder.  Then give that folder as input to this program." << endl;
        parser.print_options();
        return EXIT_SUCCESS;
    }
    parser.check_option_arg_range("views", 1, 64);
    parser.check_option_arg_range("batch", 2, 4096);

    relnet::relation_config config;
    config.num_views = get_option(parser, "views", config.num_views);
    config.batch_size = get_option(parser, "batch", config.batch_size);
    config.tot_epochs = get_option(parser, "epochs", config.tot_epochs);
    config.feature_size = get_option(parser, "features", config.feature_size);
    config.learning_rate = get_option(parser, "learning-rate", config.learning_rate);
    config.seed = get_option(parser, "seed", config.seed);
    config.print_every = get_option(parser, "print-every", config.print_every);
    const std::string model_file = get_option(parser, "model", "relnet_conv4_cifar_10.dat");
    config.validate();

    // Load the CIFAR-10 dataset into memory
    std::vector<matrix<rgb_pixel>> training_images, testing_images;
    std::vector<unsigned long> training_labels, testing_labels;
    load_cifar_10_dataset(parser[0], training_images, training_labels, testing_images, testing_labels);

    auto backbone = relnet::model::make_backbone(config.feature_size);
    if (parser.option("eval-only"))
    {
        relnet::load_backbone(model_file, backbone);
        if (relnet::model::feature_size_of(backbone) != config.feature_size)
            throw relnet::config_error("the saved backbone does not produce --features values per image");
        cout << "Backbone loaded from " << model_file << endl;
    }
    else
    {
        auto head = relnet::model::make_relation_head();
        relnet::multiview_sampler sampler(training_images, training_labels, config.num_views,
            relnet::make_augmentation(), config.seed);

        relnet::relation_trainer<relnet::model::backbone, relnet::model::relation_head> trainer(
            backbone, head, config, adam(0, 0.9, 0.999));
        trainer.be_verbose();
        cout << trainer << endl;

        const bool completed = trainer.train(sampler, &g_terminate_flag);

        // If training was interrupted by Ctrl+C, the backbone is not saved
        if (!completed) {
            cout << "Training interrupted by user after " << trainer.get_train_one_step_calls()
                 << " steps. Exiting..." << endl;
            return EXIT_FAILURE;
        }

        // The relation head is only needed for training, we just keep the backbone.
        relnet::save_backbone(model_file, backbone);
        cout << "conv4 backbone saved to " << model_file << endl;
    }

    // Now, we initialize the feature extractor model with the backbone we have just learned.
    // The batch normalization layers become affine layers using their running statistics.
    relnet::model::feature_extractor fnet(backbone);

    relnet::linear_evaluation_options options;
    options.c = get_option(parser, "svm-c", 0.0);
    options.extraction_batch_size = 4 * config.batch_size;
    options.verbose = true;
    cout << "Extracting features and training the linear classifier..." << endl;
    const auto result = relnet::evaluate_linear(fnet, training_images, training_labels,
        testing_images, testing_labels, options);

    cout << "SVM hyperparameter C: " << result.c << endl;
    cout << "\nconv4 training accuracy: " << result.training_accuracy << endl;
    cout << "conv4 testing accuracy:  " << result.testing_accuracy << endl;

    return EXIT_SUCCESS;
}
catch (const exception& e)
{
    cout << e.what() << endl;
    return EXIT_FAILURE;
}
