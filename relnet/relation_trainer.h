// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#ifndef RELNET_RELATION_TRAINER_H_
#define RELNET_RELATION_TRAINER_H_

#include "backbone_traits.h"
#include "config.h"
#include "errors.h"
#include "multiview_sampler.h"
#include "relation_pairs.h"

#include <dlib/dnn.h>
#include <atomic>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace relnet
{
    template <
        typename backbone_type,
        typename head_type,
        typename solver_type = dlib::adam
        >
    class relation_trainer
    {
        /*!
            REQUIREMENTS ON backbone_type
                - a dlib network without a loss layer (an add_layer stack) whose input
                  layer takes dlib::matrix<dlib::rgb_pixel> images and whose output
                  holds one feature vector per image.

            REQUIREMENTS ON head_type
                - a dlib network with a loss_binary_log loss layer taking one
                  concatenated pair of feature vectors per sample.

            WHAT THIS OBJECT REPRESENTS
                Trains a backbone and a relation head together by relational
                reasoning.  Every step draws K views of B images, runs the backbone
                once over all K*B views, builds the relation pairs of the resulting
                feature batch, scores them with the head against same-image /
                different-image targets and updates both networks.

                The backbone is always run over the whole K*B batch in one forward
                pass.  Its batch normalization statistics are therefore computed
                over all views of all images, which the training depends on.

                The trainer holds references to the two networks and owns the
                solvers of both.  Nothing else may change the network parameters
                while a step runs, and only train_one_step() updates them.
        !*/
    public:
        struct step_result
        {
            double loss = 0;
            double accuracy = 0;
            size_t num_pairs = 0;
        };

        relation_trainer(
            backbone_type& backbone_,
            head_type& head_,
            const relation_config& config_,
            const solver_type& solver = solver_type()
        ) :
            backbone(backbone_),
            head(head_),
            config(config_),
            backbone_solvers(backbone_type::num_computational_layers, solver),
            head_solvers(head_type::num_computational_layers, solver)
        {
            config.validate();

            const long declared = backbone_feature_size<backbone_type>::get(backbone);
            if (declared != 0 && declared != config.feature_size)
            {
                std::ostringstream sout;
                sout << "the backbone is built for " << declared << " features per image but feature_size is "
                     << config.feature_size;
                throw config_error(sout.str());
            }

            // The input layer of the head only records its sample expansion factor
            // in to_tensor().  The pairs are built directly as tensors, so run
            // to_tensor() once on a pair sized sample.
            const dlib::matrix<float> pair_sample = dlib::zeros_matrix<float>(2 * config.feature_size, 1);
            head.to_tensor(&pair_sample, &pair_sample + 1, pairs);
        }

        const relation_config& get_config() const { return config; }

        void be_verbose() { verbose = true; }
        void be_quiet() { verbose = false; }

        // Number of parameter updates applied so far, one per successful step.
        size_t get_train_one_step_calls() const { return steps; }

        /*!
            ensures
                - runs one forward and backward pass on batch and updates the
                  parameters of the backbone and the head exactly once.
                - returns the mean binary cross-entropy over the relation pairs and
                  the fraction of pairs whose logit sign matches the target.
            throws
                - degenerate_batch_error if batch does not have config.num_views
                  blocks of equal size, or if it yields no relation pair.
                - config_error if the backbone output size is not config.feature_size.
                - numeric_error if the loss or a logit is not finite.  No parameter
                  is updated in that case.
        !*/
        step_result train_one_step(
            const view_batch& batch
        )
        {
            check_batch(batch);

            backbone.to_tensor(batch.images.begin(), batch.images.end(), input);
            // one pass over every view of every image
            const dlib::tensor& features = backbone.forward(input);

            const long dims = features.k() * features.nr() * features.nc();
            if (dims != config.feature_size)
            {
                std::ostringstream sout;
                sout << "the backbone produces " << dims << " features per image but feature_size is "
                     << config.feature_size;
                throw config_error(sout.str());
            }

            const long block = block_size_of(features, config.num_views);
            if (plan.num_views() != config.num_views || plan.block_size() != block)
            {
                plan = relation_plan(config.num_views, block);
                labels = plan.binary_labels();
            }
            if (plan.empty())
                throw degenerate_batch_error("the batch yields no relation pairs, refusing to compute a loss");

            concatenate_pairs(features, plan, pairs);

            step_result result;
            result.num_pairs = plan.size();
            result.loss = head.compute_loss(pairs, labels.begin());
            if (!std::isfinite(result.loss))
            {
                std::ostringstream sout;
                sout << "non-finite relation loss (" << result.loss << ") at step " << steps;
                throw numeric_error(sout.str());
            }
            result.accuracy = relation_accuracy(head.subnet().get_output());

            head.back_propagate_error(pairs);
            feature_gradients.copy_size(features);
            feature_gradients = 0;
            scatter_pair_gradients(head.get_final_data_gradient(), plan, feature_gradients);
            backbone.back_propagate_error(input, feature_gradients);

            backbone.update_parameters(dlib::make_sstack(backbone_solvers), config.learning_rate);
            head.update_parameters(dlib::make_sstack(head_solvers), config.learning_rate);
            ++steps;
            return result;
        }

        /*!
            ensures
                - runs config.tot_epochs epochs over sampler, each a shuffled pass in
                  mini-batches of config.batch_size images.  The last short batch of
                  an epoch is dropped.
                - returns true if every epoch ran, false if *interrupt became true,
                  in which case training stops before the next step.
            throws
                - config_error if sampler does not produce config.num_views views or
                  holds fewer images than one mini-batch.
                - anything train_one_step() or the sampler throws.  The run stops.
        !*/
        bool train(
            multiview_sampler& sampler,
            const std::atomic<bool>* interrupt = nullptr
        )
        {
            if (sampler.num_views() != config.num_views)
            {
                std::ostringstream sout;
                sout << "the sampler draws " << sampler.num_views() << " views per image but num_views is "
                     << config.num_views;
                throw config_error(sout.str());
            }
            if (sampler.size() < config.batch_size)
                throw config_error("the image source holds fewer images than one mini-batch");

            view_batch_loader loader(sampler, config.batch_size, config.tot_epochs, config.prefetch_depth);
            const size_t total = loader.batches_per_epoch();

            double epoch_loss = 0;
            double epoch_accuracy = 0;
            view_batch_loader::loaded_batch item;
            while (loader.dequeue(item))
            {
                if (interrupt && interrupt->load())
                    return false;

                if (item.index == 0)
                {
                    epoch_loss = 0;
                    epoch_accuracy = 0;
                }

                const auto r = train_one_step(item.batch);
                epoch_loss += r.loss;
                epoch_accuracy += r.accuracy;

                if (verbose && item.index % config.print_every == 0)
                {
                    std::ostringstream sout;
                    sout << "Epoch [" << item.epoch << "][" << item.index << "/" << total << "] "
                         << std::fixed << std::setprecision(5) << "loss: " << r.loss << "; "
                         << std::setprecision(2) << "accuracy: " << 100 * r.accuracy << "%";
                    std::cout << sout.str() << std::endl;
                }
                if (verbose && item.index + 1 == total)
                {
                    std::ostringstream sout;
                    sout << "Epoch " << item.epoch << " done: "
                         << std::fixed << std::setprecision(5) << "mean loss " << epoch_loss / total << ", "
                         << std::setprecision(2) << "mean accuracy " << 100 * epoch_accuracy / total << "%";
                    std::cout << sout.str() << std::endl;
                }
            }
            return true;
        }

        friend std::ostream& operator<<(std::ostream& out, const relation_trainer& item)
        {
            out << "relation_trainer details: \n";
            out << "  backbone layers:     " << backbone_type::num_layers << "\n";
            out << "  head layers:         " << head_type::num_layers << "\n";
            out << "  solver:              " << item.backbone_solvers[0] << "\n";
            out << "  relation pairs/step: "
                << item.config.batch_size * item.config.num_views * (item.config.num_views - 1) << "\n";
            out << item.config;
            return out;
        }

    private:
        void check_batch(
            const view_batch& batch
        ) const
        {
            std::ostringstream sout;
            if (batch.num_views != config.num_views)
                sout << "the batch holds " << batch.num_views << " views per image but num_views is "
                     << config.num_views;
            else if (batch.batch_size < 1 ||
                batch.images.size() != static_cast<size_t>(batch.num_views * batch.batch_size))
                sout << "the batch holds " << batch.images.size() << " images, which is not "
                     << batch.num_views << " blocks of " << batch.batch_size;
            else
                return;
            throw degenerate_batch_error(sout.str());
        }

        double relation_accuracy(
            const dlib::tensor& logits
        ) const
        {
            const float* out = logits.host();
            size_t num_right = 0;
            for (size_t n = 0; n < labels.size(); ++n)
            {
                if (!std::isfinite(out[n]))
                    throw numeric_error("non-finite relation logit");
                // round(sigmoid(x)) is 1 only for x > 0
                if ((out[n] > 0) == (labels[n] > 0))
                    ++num_right;
            }
            return num_right / static_cast<double>(labels.size());
        }

        backbone_type& backbone;
        head_type& head;
        relation_config config;
        std::vector<solver_type> backbone_solvers;
        std::vector<solver_type> head_solvers;

        dlib::resizable_tensor input;
        dlib::resizable_tensor pairs;
        dlib::resizable_tensor feature_gradients;
        relation_plan plan;
        std::vector<float> labels;

        size_t steps = 0;
        bool verbose = false;
    };
}

#endif // RELNET_RELATION_TRAINER_H_
