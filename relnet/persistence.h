// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#ifndef RELNET_PERSISTENCE_H_
#define RELNET_PERSISTENCE_H_

#include <dlib/dnn.h>
#include <string>

namespace relnet
{
    // Drops the cached outputs and gradients of net, then writes its layers and
    // parameters to filename.  Only the backbone is saved after training.
    template <typename net_type>
    void save_backbone(
        const std::string& filename,
        net_type& net
    )
    {
        net.clean();
        dlib::serialize(filename) << net;
    }

    // Throws dlib::serialization_error if filename does not hold a net_type.
    template <typename net_type>
    void load_backbone(
        const std::string& filename,
        net_type& net
    )
    {
        dlib::deserialize(filename) >> net;
    }
}

#endif // RELNET_PERSISTENCE_H_
