#include "backup_config.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <json/json.h>
#include <map>
#include <print>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    return timeBuf;
}

void appendToLog(const std::string& logFile, const std::string& logEntry) {
    if (logFile.empty()) {
        return;
    }
    std::ofstream log(logFile, std::ios::app);
    if (log.is_open()) {
        log << logEntry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", logFile);
    }
}

std::string keyName(const std::string& context, const std::string& key) {
    return context.empty() ? key : std::format("{}[{}]", context, key);
}

std::string requireString(const Json::Value& data, const std::string& key, const std::string& context) {
    if (!data.isMember(key)) {
        throw std::runtime_error(std::format("`{}` is required.", keyName(context, key)));
    }
    if (!data[key].isString()) {
        throw std::runtime_error(std::format("`{}` must be a string.", keyName(context, key)));
    }
    return data[key].asString();
}

std::optional<std::string> optionalString(const Json::Value& data, const std::string& key, const std::string& context) {
    if (!data.isMember(key)) {
        return std::nullopt;
    }
    return requireString(data, key, context);
}

std::vector<std::string> stringList(const Json::Value& data, const std::string& key, const std::string& context) {
    std::vector<std::string> values;
    if (!data.isMember(key)) {
        return values;
    }
    if (!data[key].isArray()) {
        throw std::runtime_error(std::format("`{}` must be a list of strings.", keyName(context, key)));
    }
    for (const auto& value : data[key]) {
        if (!value.isString()) {
            throw std::runtime_error(std::format("`{}` must be a list of strings.", keyName(context, key)));
        }
        values.push_back(value.asString());
    }
    return values;
}

std::optional<std::vector<std::string>> optionalStringList(const Json::Value& data, const std::string& key, const std::string& context) {
    if (!data.isMember(key)) {
        return std::nullopt;
    }
    return stringList(data, key, context);
}

fs::path resolvePath(const fs::path& workingDirectory, const std::string& path) {
    fs::path resolved(path);
    if (resolved.is_relative()) {
        resolved = workingDirectory / resolved;
    }
    return resolved.lexically_normal();
}

SshEndpoint parseSshEndpoint(const Json::Value& data, const fs::path& workingDirectory, const std::string& context) {
    SshEndpoint endpoint;
    endpoint.user = requireString(data, "user", context);
    endpoint.host = requireString(data, "host", context);
    endpoint.path = requireString(data, "path", context);
    if (data.isMember("port")) {
        if (!data["port"].isInt() || data["port"].asInt() < 0 || data["port"].asInt() > 65535) {
            throw std::runtime_error(std::format("`{}[port]` must be an integer ranging from 0 to 65535.", context));
        }
        endpoint.port = static_cast<std::uint16_t>(data["port"].asInt());
    }
    if (auto identity = optionalString(data, "identity", context)) {
        endpoint.identity = resolvePath(workingDirectory, *identity).string();
    }
    if (auto knownHosts = optionalString(data, "known_hosts", context)) {
        endpoint.knownHosts = resolvePath(workingDirectory, *knownHosts).string();
    }
    return endpoint;
}

using SourceFactory = std::function<std::unique_ptr<Source>(const Json::Value&, const fs::path&, Notifier&, const std::string&)>;
using TargetFactory = std::function<std::unique_ptr<Target>(const Json::Value&, const fs::path&, Notifier&, const std::string&)>;
using NotifierFactory = std::function<std::unique_ptr<Notifier>(const Json::Value&, const fs::path&, const std::string&)>;

const std::map<std::string, SourceFactory>& sourceFactories() {
    static const std::map<std::string, SourceFactory> factories = {
        {"path", [](const Json::Value& data, const fs::path& workingDirectory, Notifier& notifier, const std::string& context) {
            return std::make_unique<PathSource>(notifier, resolvePath(workingDirectory, requireString(data, "path", context)));
        }},
        {"ssh", [](const Json::Value& data, const fs::path& workingDirectory, Notifier& notifier, const std::string& context) {
            return std::make_unique<SshSource>(notifier, parseSshEndpoint(data, workingDirectory, context));
        }},
    };
    return factories;
}

const std::map<std::string, TargetFactory>& targetFactories() {
    static const std::map<std::string, TargetFactory> factories = {
        {"path", [](const Json::Value& data, const fs::path& workingDirectory, Notifier& notifier, const std::string& context) {
            return std::make_unique<PathTarget>(notifier, resolvePath(workingDirectory, requireString(data, "path", context)));
        }},
        {"ssh", [](const Json::Value& data, const fs::path& workingDirectory, Notifier& notifier, const std::string& context) {
            return std::make_unique<SshTarget>(notifier, parseSshEndpoint(data, workingDirectory, context));
        }},
    };
    return factories;
}

const std::map<std::string, NotifierFactory>& notifierFactories() {
    static const std::map<std::string, NotifierFactory> factories = {
        {"stdio", [](const Json::Value&, const fs::path&, const std::string&) -> std::unique_ptr<Notifier> {
            return std::make_unique<StdioNotifier>();
        }},
        {"notify-send", [](const Json::Value&, const fs::path&, const std::string&) -> std::unique_ptr<Notifier> {
            return std::make_unique<NotifySendNotifier>();
        }},
        {"command", [](const Json::Value& data, const fs::path&, const std::string& context) -> std::unique_ptr<Notifier> {
            auto fallback = optionalStringList(data, "fallback", context);
            auto state = optionalStringList(data, "state", context);
            auto inform = optionalStringList(data, "inform", context);
            auto confirm = optionalStringList(data, "confirm", context);
            auto alert = optionalStringList(data, "alert", context);
            if (!fallback && (!state || !inform || !confirm || !alert)) {
                throw std::runtime_error(std::format("`{}[fallback]` must be given if one or more of the other commands are omitted.", context));
            }
            return std::make_unique<CommandNotifier>(state, inform, confirm, alert, fallback);
        }},
        {"file", [](const Json::Value& data, const fs::path& workingDirectory, const std::string& context) -> std::unique_ptr<Notifier> {
            return std::make_unique<FileNotifier>(
                resolvePath(workingDirectory, requireString(data, "state", context)).string(),
                resolvePath(workingDirectory, requireString(data, "inform", context)).string(),
                resolvePath(workingDirectory, requireString(data, "confirm", context)).string(),
                resolvePath(workingDirectory, requireString(data, "alert", context)).string());
        }},
        {"telegram", [](const Json::Value& data, const fs::path&, const std::string& context) -> std::unique_ptr<Notifier> {
            return std::make_unique<TelegramNotifier>(requireString(data, "bot_token", context), requireString(data, "chat_id", context));
        }},
    };
    return factories;
}

template <typename Factories>
const typename Factories::mapped_type& lookupFactory(const Factories& factories, const Json::Value& data, const std::string& context) {
    std::string type = requireString(data, "type", context);
    auto it = factories.find(type);
    if (it == factories.end()) {
        std::string known;
        for (const auto& [name, factory] : factories) {
            known += known.empty() ? name : ", " + name;
        }
        throw std::runtime_error(std::format("`{}[type]` must be one of the following: {}, but `{}` was given.", context, known, type));
    }
    return it->second;
}

std::unique_ptr<Notifier> parseNotifiers(const Json::Value& root, const fs::path& workingDirectory) {
    std::vector<std::unique_ptr<Notifier>> notifiers;
    if (root.isMember("notifications")) {
        if (!root["notifications"].isArray()) {
            throw std::runtime_error("`notifications` must be a list.");
        }
        for (const auto& data : root["notifications"]) {
            const auto& factory = lookupFactory(notifierFactories(), data, "notifications[]");
            notifiers.push_back(factory(data, workingDirectory, "notifications[]"));
        }
    }
    if (notifiers.empty()) {
        return std::make_unique<StdioNotifier>();
    }
    if (notifiers.size() == 1) {
        return std::move(notifiers.front());
    }
    return std::make_unique<GroupedNotifier>(std::move(notifiers));
}

}

Configuration::Configuration(std::string name, std::unique_ptr<Notifier> notifier)
    : notifier(notifier ? std::move(notifier) : std::make_unique<StdioNotifier>()), name(std::move(name)) {}

void Configuration::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", currentTimestamp(), message);
    std::println("{}", logEntry);
    appendToLog(logFile, logEntry);
}

void Configuration::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", currentTimestamp(), message);
    std::println(stderr, "{}", logEntry);
    appendToLog(logFile, logEntry);
}

Configuration loadConfiguration(const std::string& configFile, std::optional<bool> verbose) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(file, root)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}: {}", configFile, reader.getFormattedErrorMessages()));
    }
    if (!root.isObject()) {
        throw std::runtime_error(std::format("Config file {} must contain a JSON object", configFile));
    }

    fs::path workingDirectory = fs::absolute(fs::path(configFile)).parent_path();

    std::string name = workingDirectory.string();
    if (auto configuredName = optionalString(root, "name", "")) {
        name = *configuredName;
    }

    Configuration config(name, parseNotifiers(root, workingDirectory));

    if (root.isMember("verbose")) {
        if (!root["verbose"].isBool()) {
            throw std::runtime_error("`verbose` must be a boolean.");
        }
        config.verbose = root["verbose"].asBool();
    }
    if (verbose) {
        config.verbose = *verbose;
    }

    if (root.isMember("logging")) {
        if (auto logFile = optionalString(root["logging"], "file", "logging")) {
            config.logFile = resolvePath(workingDirectory, *logFile).string();
        }
    }

    if (!root.isMember("source")) {
        throw std::runtime_error("`source` is required.");
    }
    const auto& sourceFactory = lookupFactory(sourceFactories(), root["source"], "source");
    config.source = sourceFactory(root["source"], workingDirectory, *config.notifier, "source");

    if (!root.isMember("targets") || !root["targets"].isArray() || root["targets"].empty()) {
        throw std::runtime_error("`targets` is required and must be a non-empty list.");
    }
    std::vector<std::unique_ptr<Target>> targets;
    for (const auto& data : root["targets"]) {
        const auto& targetFactory = lookupFactory(targetFactories(), data, "targets[]");
        targets.push_back(targetFactory(data, workingDirectory, *config.notifier, "targets[]"));
    }
    config.target = std::make_unique<FirstAvailableTarget>(std::move(targets));

    config.transferOptions.includes = stringList(root, "includes", "");
    config.transferOptions.excludes = stringList(root, "excludes", "");
    config.transferOptions.sshOptions = stringList(root, "ssh_options", "");

    return config;
}

std::vector<std::string> locationTypes() {
    std::vector<std::string> types;
    for (const auto& [type, factory] : targetFactories()) {
        types.push_back(type);
    }
    return types;
}

std::vector<std::string> notifierTypes() {
    std::vector<std::string> types;
    for (const auto& [type, factory] : notifierFactories()) {
        types.push_back(type);
    }
    return types;
}
