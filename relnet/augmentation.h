// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#ifndef RELNET_AUGMENTATION_H_
#define RELNET_AUGMENTATION_H_

#include <dlib/image_transforms.h>
#include <dlib/matrix.h>
#include <dlib/pixel.h>
#include <dlib/rand.h>
#include <functional>

namespace relnet
{
    // Produces one augmented view of an image, drawing all randomness from rnd.
    using augmentation_function = std::function<dlib::matrix<dlib::rgb_pixel>(
        const dlib::matrix<dlib::rgb_pixel>&, dlib::rand&)>;

    struct augmentation_options
    {
        long output_size = 32;
        double min_crop_scale = 0.2;
        double max_crop_scale = 1.0;
        double flip_probability = 0.5;
        double color_probability = 0.8;
        double grayscale_probability = 0.2;
    };

    dlib::rectangle make_random_cropping_rect(
        const dlib::matrix<dlib::rgb_pixel>& image,
        double min_scale,
        double max_scale,
        dlib::rand& rnd
    );
    /*!
        requires
            - 0 < min_scale <= max_scale <= 1
        ensures
            - returns a square lying inside image whose side is a random fraction in
              [min_scale, max_scale] of the short image side.
    !*/

    dlib::matrix<dlib::rgb_pixel> augment(
        const dlib::matrix<dlib::rgb_pixel>& image,
        const augmentation_options& options,
        dlib::rand& rnd
    );
    /*!
        ensures
            - returns an options.output_size square view of image: random resized
              crop, random left-right flip, random color disturbance and random
              conversion to grayscale.
    !*/

    augmentation_function make_augmentation(
        const augmentation_options& options = augmentation_options()
    );
}

#endif // RELNET_AUGMENTATION_H_
