// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#include "config.h"
#include "errors.h"

#include <cmath>
#include <ostream>
#include <sstream>

namespace relnet
{
    void relation_config::validate() const
    {
        std::ostringstream sout;
        if (num_views < 2)
            sout << "num_views must be at least 2 to form relation pairs, got " << num_views;
        else if (batch_size < 2)
            sout << "batch_size must be at least 2 so that negative pairs exist, got " << batch_size;
        else if (tot_epochs < 1)
            sout << "tot_epochs must be at least 1";
        else if (feature_size < 1)
            sout << "feature_size must be positive, got " << feature_size;
        else if (!(learning_rate > 0) || !std::isfinite(learning_rate))
            sout << "learning_rate must be a positive finite number, got " << learning_rate;
        else if (print_every < 1)
            sout << "print_every must be at least 1";
        else if (prefetch_depth < 1)
            sout << "prefetch_depth must be at least 1";
        else
            return;

        throw config_error(sout.str());
    }

    std::ostream& operator<<(std::ostream& out, const relation_config& item)
    {
        out << "relation_config details: \n";
        out << "  num_views:      " << item.num_views << "\n";
        out << "  batch_size:     " << item.batch_size << "\n";
        out << "  tot_epochs:     " << item.tot_epochs << "\n";
        out << "  feature_size:   " << item.feature_size << "\n";
        out << "  learning_rate:  " << item.learning_rate << "\n";
        out << "  seed:           " << item.seed << "\n";
        out << "  print_every:    " << item.print_every << "\n";
        out << "  prefetch_depth: " << item.prefetch_depth << "\n";
        return out;
    }
}
