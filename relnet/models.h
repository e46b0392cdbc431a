// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#ifndef RELNET_MODELS_H_
#define RELNET_MODELS_H_

#include "backbone_traits.h"
#include "errors.h"

#include <dlib/dnn.h>
#include <sstream>

// This namespace contains the definitions for:
// - the conv4 backbone trained by relational reasoning, with batch norm layers,
// - the same backbone with affine layers, wrapped in loss_metric, to extract frozen
//   features for the linear evaluation,
// - the relation head scoring a pair of concatenated feature vectors.
namespace relnet
{
namespace model
{
    using namespace dlib;

    // Four conv3x3 -> BN -> ReLU -> max pool blocks, then global average pooling.
    // A 32x32 input leaves a 2x2 map before the pooling.
    template <template <typename> class BN>
    struct conv4
    {
        template <long N, typename SUBNET>
        using block = max_pool<2, 2, 2, 2, relu<BN<con<N, 3, 3, 1, 1, SUBNET>>>>;

        template <typename INPUT>
        using backbone = avg_pool_everything<
            block<64, block<32, block<16, block<8, INPUT>>>>>;
    };

    // Index of the last convolution, whose filter count is the feature size.
    const size_t feature_layer_index = 4;

    using backbone = conv4<bn_con>::backbone<input_rgb_image>;
    using feature_extractor = loss_metric<conv4<affine>::backbone<input_rgb_image>>;

    template <typename SUBNET>
    using relation_mlp = fc<1, leaky_relu<bn_fc<fc<256, SUBNET>>>>;

    // loss_binary_log is the binary cross-entropy on the raw logit.
    using relation_head = loss_binary_log<relation_mlp<input<matrix<float>>>>;

    inline backbone make_backbone(
        long feature_size
    )
    {
        if (feature_size < 1)
        {
            std::ostringstream sout;
            sout << "the backbone feature size must be positive, got " << feature_size;
            throw config_error(sout.str());
        }
        backbone net;
        layer<feature_layer_index>(net).layer_details().set_num_filters(feature_size);
        return net;
    }

    inline long feature_size_of(
        const backbone& net
    )
    {
        // avg_pool_everything -> max_pool -> relu -> bn -> con
        return net.subnet().subnet().subnet().subnet().layer_details().num_filters();
    }

    inline relation_head make_relation_head()
    {
        relation_head head;
        disable_duplicative_biases(head);
        return head;
    }
}

    template <>
    struct backbone_feature_size<model::backbone>
    {
        static long get(const model::backbone& net) { return model::feature_size_of(net); }
    };
}

#endif // RELNET_MODELS_H_
