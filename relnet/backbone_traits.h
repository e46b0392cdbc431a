// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#ifndef RELNET_BACKBONE_TRAITS_H_
#define RELNET_BACKBONE_TRAITS_H_

namespace relnet
{
    /*!
        WHAT THIS OBJECT REPRESENTS
            Tells how many features a backbone produces per image without running it.
            get() returns 0 when the network type does not say, in which case the
            size is only known after the first forward pass.  Specialize it for
            backbones whose feature size is part of their layer details.
    !*/
    template <typename net_type>
    struct backbone_feature_size
    {
        static long get(const net_type&) { return 0; }
    };
}

#endif // RELNET_BACKBONE_TRAITS_H_
