#include "app_registry.hpp"
#include "chatling_client.hpp"
#include "launch_config.hpp"
#include "skill_app.hpp"

#include <functional>
#include <map>
#include <memory>

namespace skill
{
    namespace
    {
        using app_factory = std::function<request_handler()>;

        request_handler make_skill_app()
        {
            auto chatling = std::make_shared<chatling_client>(chatling_settings::from_environment());
            auto app = std::make_shared<skill_app>(std::move(chatling));
            return [app](const http_request &req)
            { return (*app)(req); };
        }

        const std::map<std::string, app_factory> &registry()
        {
            static const std::map<std::string, app_factory> apps = {
                {"app:app", make_skill_app},
            };
            return apps;
        }
    }

    request_handler resolve_application(const std::string &name)
    {
        std::string module = name;
        std::string object = "application";
        auto colon = name.find(':');
        if (colon != std::string::npos)
        {
            module = name.substr(0, colon);
            object = name.substr(colon + 1);
        }
        if (module.empty() || object.empty())
            throw config_error("Failed to parse '" + name + "' as an application object");

        auto it = registry().find(module + ":" + object);
        if (it == registry().end())
            throw config_error("Failed to find application object '" + object + "' in '" + module + "'");
        return it->second();
    }
}
