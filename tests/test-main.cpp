#include <gtest/gtest.h>

#include <gdkmm/wrap_init.h>
#include <giomm/init.h>
#include <iostream>
#include <wayfire/util/log.hpp>

int main(int argc, char **argv)
{
    Gio::init();
    Gdk::wrap_init();
    wf::log::initialize_logging(std::cerr, wf::log::LOG_LEVEL_ERROR, wf::log::LOG_COLOR_MODE_OFF);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
