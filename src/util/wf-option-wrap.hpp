#pragma once

#include <wayfire/config/config-manager.hpp>
#include <wayfire/config/option-wrapper.hpp>

/**
 * An implementation of wf::base_option_wrapper_t which reads its option
 * from the config manager of a WayfireServiceApp.
 */
template<class Type>
class WfOption : public wf::base_option_wrapper_t<Type>
{
  public:
    WfOption(wf::config::config_manager_t& config, const std::string& option_name) :
        config(config)
    {
        this->load_option(option_name);
    }

  protected:
    std::shared_ptr<wf::config::option_base_t>
        load_raw_option(const std::string& name) override
    {
        return config.get_option(name);
    }

  private:
    wf::config::config_manager_t& config;
};
