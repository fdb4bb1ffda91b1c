#ifndef WF_SERVICE_APP_HPP
#define WF_SERVICE_APP_HPP

#include <optional>
#include <string>
#include <wayfire/config/config-manager.hpp>

#include <giomm/application.h>

/**
 * A basic background service without windows.
 *
 * It parses the common command line options, loads the configuration and
 * reloads it whenever the config file changes, then runs the main loop until
 * the process is terminated.
 */
class WayfireServiceApp
{
  protected:
    std::optional<std::string> cmdline_config;
    bool cmdline_replace = false;
    bool cmdline_debug   = false;

    Glib::RefPtr<Gio::Application> app;

    /* The following functions can be overridden in the service implementation
     * to handle the events */
    virtual void on_activate();
    virtual bool parse_cfgfile(const Glib::ustring & option_name,
        const Glib::ustring & value, bool has_value);
    virtual bool parse_replace(const Glib::ustring & option_name,
        const Glib::ustring & value, bool has_value);
    virtual bool parse_debug(const Glib::ustring & option_name,
        const Glib::ustring & value, bool has_value);

    /** Name of the config file in the user's config directory */
    virtual std::string get_config_file_name() = 0;
    /** Name of the system wide defaults file in SYSCONF_DIR/wayfire */
    virtual std::string get_defaults_file_name() = 0;

  public:
    int inotify_fd = -1;
    wf::config::config_manager_t config;

    WayfireServiceApp(const Glib::ustring & application_id);
    virtual ~WayfireServiceApp();

    WayfireServiceApp(const WayfireServiceApp &) = delete;
    WayfireServiceApp & operator =(const WayfireServiceApp &) = delete;

    virtual std::string get_config_file();
    virtual int run(int argc, char **argv);

    virtual void on_config_reload()
    {}
};

#endif /* end of include guard: WF_SERVICE_APP_HPP */
