#include "wf-service-app.hpp"
#include <giomm/applicationcommandline.h>
#include <glibmm/main.h>
#include <glibmm/optionentry.h>
#include <sys/inotify.h>
#include <cstdlib>
#include <iostream>
#include <wayfire/config/file.hpp>
#include <wayfire/util/log.hpp>

#include <unistd.h>

std::string WayfireServiceApp::get_config_file()
{
    if (cmdline_config.has_value())
    {
        return cmdline_config.value();
    }

    std::string config_dir;

    char *config_home = getenv("XDG_CONFIG_HOME");
    if (config_home == NULL)
    {
        config_dir = std::string(getenv("HOME")) + "/.config";
    } else
    {
        config_dir = std::string(config_home);
    }

    return config_dir + "/" + get_config_file_name();
}

bool WayfireServiceApp::parse_cfgfile(const Glib::ustring & option_name,
    const Glib::ustring & value, bool has_value)
{
    std::cout << "Using custom config file " << value << std::endl;
    cmdline_config = value;
    return true;
}

bool WayfireServiceApp::parse_replace(const Glib::ustring & option_name,
    const Glib::ustring & value, bool has_value)
{
    cmdline_replace = true;
    return true;
}

bool WayfireServiceApp::parse_debug(const Glib::ustring & option_name,
    const Glib::ustring & value, bool has_value)
{
    cmdline_debug = true;
    return true;
}

#define INOT_BUF_SIZE (1024 * sizeof(inotify_event))
static char buf[INOT_BUF_SIZE];

/* Reload file and add next inotify watch */
static void do_reload_config(WayfireServiceApp *app)
{
    wf::config::load_configuration_options_from_file(
        app->config, app->get_config_file());
    app->on_config_reload();
    if (inotify_add_watch(app->inotify_fd, app->get_config_file().c_str(), IN_MODIFY) < 0)
    {
        LOGD("Not watching ", app->get_config_file(), " for changes, it does not exist");
    }
}

/* Handle inotify event */
static bool handle_inotify_event(WayfireServiceApp *app, Glib::IOCondition cond)
{
    /* read, but don't use */
    if (read(app->inotify_fd, buf, INOT_BUF_SIZE) < 0)
    {
        LOGE("Failed to read config change events");
    }

    do_reload_config(app);
    return true;
}

void WayfireServiceApp::on_activate()
{
    app->hold();

    wf::log::initialize_logging(std::cerr,
        cmdline_debug ? wf::log::LOG_LEVEL_DEBUG : wf::log::LOG_LEVEL_INFO,
        wf::log::LOG_COLOR_MODE_AUTO);

    std::vector<std::string> xmldirs(1, METADATA_DIR);

    // setup config
    this->config = wf::config::build_configuration(
        xmldirs, SYSCONF_DIR "/wayfire/" + get_defaults_file_name(),
        get_config_file());

    inotify_fd = inotify_init();
    do_reload_config(this);

    Glib::signal_io().connect(
        sigc::bind<0>(&handle_inotify_event, this),
        inotify_fd, Glib::IO_IN | Glib::IO_HUP);
}

WayfireServiceApp::WayfireServiceApp(const Glib::ustring & application_id)
{
    app = Gio::Application::create(application_id,
        Gio::APPLICATION_HANDLES_COMMAND_LINE);
    app->signal_activate().connect(
        sigc::mem_fun(this, &WayfireServiceApp::on_activate));
    app->add_main_option_entry(
        sigc::mem_fun(this, &WayfireServiceApp::parse_cfgfile),
        "config", 'c', "config file to use", "file");
    app->add_main_option_entry(
        sigc::mem_fun(this, &WayfireServiceApp::parse_replace),
        "replace", 'r', "replace a running instance", "",
        Glib::OptionEntry::FLAG_NO_ARG);
    app->add_main_option_entry(
        sigc::mem_fun(this, &WayfireServiceApp::parse_debug),
        "debug", 'd', "enable debug logging", "",
        Glib::OptionEntry::FLAG_NO_ARG);

    // Activate app after parsing command line. A second instance only
    // forwards its command line to us, there is nothing to do for it.
    app->signal_command_line().connect([=] (const Glib::RefPtr<Gio::ApplicationCommandLine>& command_line)
    {
        if (!command_line->is_remote())
        {
            app->activate();
        }

        return 0;
    }, false);
}

WayfireServiceApp::~WayfireServiceApp()
{
    if (inotify_fd >= 0)
    {
        close(inotify_fd);
    }
}

int WayfireServiceApp::run(int argc, char **argv)
{
    return app->run(argc, argv);
}
