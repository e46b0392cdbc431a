// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#ifndef RELNET_ERRORS_H_
#define RELNET_ERRORS_H_

#include <dlib/error.h>
#include <string>

namespace relnet
{
    // Bad configuration values, or a backbone whose output does not match them.
    class config_error : public dlib::error
    {
    public:
        config_error(const std::string& message) : dlib::error(message) {}
    };

    // A batch that can't be split into equal view blocks or that yields no relation pairs.
    class degenerate_batch_error : public dlib::error
    {
    public:
        degenerate_batch_error(const std::string& message) : dlib::error(message) {}
    };

    class numeric_error : public dlib::error
    {
    public:
        numeric_error(const std::string& message) : dlib::error(message) {}
    };
}

#endif // RELNET_ERRORS_H_
