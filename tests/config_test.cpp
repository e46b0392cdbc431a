// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#include <gtest/gtest.h>

#include "relnet/config.h"
#include "relnet/errors.h"
#include "relnet/models.h"

#include <limits>
#include <sstream>

namespace relnet
{
    TEST(RelationConfig, DefaultsAreValid)
    {
        relation_config config;
        EXPECT_NO_THROW(config.validate());
        EXPECT_EQ(config.num_views, 4);
        EXPECT_EQ(config.batch_size, 64u);
        EXPECT_EQ(config.feature_size, 64);
    }

    TEST(RelationConfig, RejectsBadValues)
    {
        relation_config config;
        config.num_views = 1;
        EXPECT_THROW(config.validate(), config_error);

        config = relation_config();
        config.batch_size = 1;
        EXPECT_THROW(config.validate(), config_error);

        config = relation_config();
        config.tot_epochs = 0;
        EXPECT_THROW(config.validate(), config_error);

        config = relation_config();
        config.feature_size = 0;
        EXPECT_THROW(config.validate(), config_error);

        config = relation_config();
        config.learning_rate = 0;
        EXPECT_THROW(config.validate(), config_error);

        config = relation_config();
        config.learning_rate = std::numeric_limits<double>::infinity();
        EXPECT_THROW(config.validate(), config_error);

        config = relation_config();
        config.print_every = 0;
        EXPECT_THROW(config.validate(), config_error);
    }

    TEST(RelationConfig, ErrorNamesTheValue)
    {
        relation_config config;
        config.num_views = 1;
        try
        {
            config.validate();
            FAIL() << "expected config_error";
        }
        catch (const config_error& e)
        {
            EXPECT_NE(std::string(e.what()).find("num_views"), std::string::npos);
        }
    }

    TEST(RelationConfig, Printable)
    {
        std::ostringstream sout;
        sout << relation_config();
        EXPECT_NE(sout.str().find("batch_size:     64"), std::string::npos);
    }

    TEST(Models, BackboneFeatureSize)
    {
        EXPECT_EQ(model::feature_size_of(model::make_backbone(32)), 32);
        EXPECT_THROW(model::make_backbone(0), config_error);
    }
}
