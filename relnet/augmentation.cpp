// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#include "augmentation.h"

#include <algorithm>

namespace relnet
{
    using namespace dlib;

    rectangle make_random_cropping_rect(
        const matrix<rgb_pixel>& image,
        double min_scale,
        double max_scale,
        dlib::rand& rnd
    )
    {
        DLIB_CASSERT(0 < min_scale && min_scale <= max_scale && max_scale <= 1);
        const auto scale = rnd.get_double_in_range(min_scale, max_scale);
        const auto size = std::max<long>(1, scale * std::min(image.nr(), image.nc()));
        const rectangle rect(size, size);
        // +1 so that a crop covering the whole side still gets a valid (zero) offset
        const point offset(rnd.get_random_32bit_number() % (image.nc() - rect.width() + 1),
            rnd.get_random_32bit_number() % (image.nr() - rect.height() + 1));
        return move_rect(rect, offset);
    }

    matrix<rgb_pixel> augment(
        const matrix<rgb_pixel>& image,
        const augmentation_options& options,
        dlib::rand& rnd
    )
    {
        matrix<rgb_pixel> crop;

        // randomly crop and resize back to the network input size
        const auto rect = make_random_cropping_rect(image, options.min_crop_scale, options.max_crop_scale, rnd);
        extract_image_chip(image, chip_details(rect, chip_dims(options.output_size, options.output_size)), crop);

        // image left-right flip
        if (rnd.get_random_double() < options.flip_probability)
            flip_image_left_right(crop);

        // color augmentation
        if (rnd.get_random_double() < options.color_probability)
            disturb_colors(crop, rnd, 0.4, 0.4);

        // grayscale
        if (rnd.get_random_double() < options.grayscale_probability)
        {
            matrix<unsigned char> gray;
            assign_image(gray, crop);
            assign_image(crop, gray);
        }
        return crop;
    }

    augmentation_function make_augmentation(
        const augmentation_options& options
    )
    {
        return [options](const matrix<rgb_pixel>& image, dlib::rand& rnd)
        {
            return augment(image, options, rnd);
        };
    }
}
