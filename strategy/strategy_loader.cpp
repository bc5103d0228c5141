#include "strategy_loader.H"

#include "threshold_strategy.H"

#include <dlfcn.h>

#include <stdexcept>

namespace predex::strategy {

typedef int (*abi_version_fn)();
typedef Strategy* (*create_strategy_fn)(const char* params_json);

StrategyLoader::StrategyLoader(std::shared_ptr<spdlog::logger> logger)
    : logger(logger) {
    register_factory("threshold", [](const nlohmann::json& params) {
        return std::make_unique<ThresholdStrategy>(params);
    });
}

StrategyLoader::~StrategyLoader() {
    for (void* handle : handles) {
        dlclose(handle);
    }
}

void StrategyLoader::register_factory(const std::string& name, StrategyFactory factory) {
    if (name.empty() || !factory) {
        throw std::invalid_argument("Strategy factory needs a name and a callable");
    }
    if (!factories.emplace(name, std::move(factory)).second) {
        throw std::invalid_argument("Strategy " + name + " is already registered");
    }
}

bool StrategyLoader::has(const std::string& name) const {
    return factories.count(name) != 0;
}

std::vector<std::string> StrategyLoader::get_names() const {
    std::vector<std::string> names;
    for (const auto& [name, factory] : factories) {
        names.push_back(name);
    }
    return names;
}

bool StrategyLoader::is_plugin_path(const std::string& name_or_path) {
    if (name_or_path.find('/') != std::string::npos) {
        return true;
    }
    return name_or_path.size() > 3 && name_or_path.compare(name_or_path.size() - 3, 3, ".so") == 0;
}

std::unique_ptr<Strategy> StrategyLoader::load(const std::string& name_or_path, const nlohmann::json& params) {
    if (!params.is_object()) {
        throw std::runtime_error("Strategy parameters must be a JSON object");
    }

    if (is_plugin_path(name_or_path)) {
        return load_plugin(name_or_path, params);
    }

    auto it = factories.find(name_or_path);
    if (it == factories.end()) {
        std::string known;
        for (const auto& name : get_names()) {
            known += (known.empty() ? "" : ", ") + name;
        }
        throw std::runtime_error("Unknown strategy '" + name_or_path + "', known: " + known);
    }

    std::unique_ptr<Strategy> strategy;
    try {
        strategy = it->second(params);
    } catch (const std::exception& e) {
        throw std::runtime_error("Strategy " + name_or_path + " failed to initialize: " + e.what());
    }
    validate(name_or_path, strategy);
    logger->info("Loaded built-in strategy {}", strategy->get_name());
    return strategy;
}

std::unique_ptr<Strategy> StrategyLoader::load_plugin(const std::string& path, const nlohmann::json& params) {
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        const char* error = dlerror();
        throw std::runtime_error("Failed to load strategy plugin " + path + ": " + (error ? error : "unknown error"));
    }

    auto abi = reinterpret_cast<abi_version_fn>(dlsym(handle, "predex_strategy_abi_version"));
    auto create = reinterpret_cast<create_strategy_fn>(dlsym(handle, "predex_create_strategy"));
    if (abi == nullptr || create == nullptr) {
        dlclose(handle);
        throw std::runtime_error("Strategy plugin " + path
            + " must export predex_strategy_abi_version and predex_create_strategy");
    }
    if (abi() != PREDEX_STRATEGY_ABI_VERSION) {
        int found = abi();
        dlclose(handle);
        throw std::runtime_error("Strategy plugin " + path + " has ABI version " + std::to_string(found)
            + ", expected " + std::to_string(PREDEX_STRATEGY_ABI_VERSION));
    }

    std::unique_ptr<Strategy> strategy;
    try {
        strategy.reset(create(params.dump().c_str()));
        validate(path, strategy);
    } catch (const std::exception& e) {
        strategy.reset();
        dlclose(handle);
        throw std::runtime_error("Strategy plugin " + path + " failed to initialize: " + e.what());
    }

    handles.push_back(handle);
    logger->info("Loaded strategy {} from {}", strategy->get_name(), path);
    return strategy;
}

void StrategyLoader::validate(const std::string& source, const std::unique_ptr<Strategy>& strategy) const {
    if (!strategy) {
        throw std::runtime_error("Strategy " + source + " produced no instance");
    }
    if (strategy->get_name().empty()) {
        throw std::runtime_error("Strategy from " + source + " has no name");
    }
}

} // namespace predex::strategy
