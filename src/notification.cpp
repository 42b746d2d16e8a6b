#include "notification.hpp"
#include "process.hpp"
#include <chrono>
#include <ctime>
#include <curl/curl.h>
#include <format>
#include <fstream>
#include <print>
#include <stdexcept>
#include <utility>

size_t writeCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

GroupedNotifier::GroupedNotifier(std::vector<std::unique_ptr<Notifier>> notifiers)
    : notifiers_(std::move(notifiers)) {}

void GroupedNotifier::state(const std::string& message) {
    for (auto& notifier : notifiers_) {
        notifier->state(message);
    }
}

void GroupedNotifier::inform(const std::string& message) {
    for (auto& notifier : notifiers_) {
        notifier->inform(message);
    }
}

void GroupedNotifier::confirm(const std::string& message) {
    for (auto& notifier : notifiers_) {
        notifier->confirm(message);
    }
}

void GroupedNotifier::alert(const std::string& message) {
    for (auto& notifier : notifiers_) {
        notifier->alert(message);
    }
}

void StdioNotifier::print(const std::string& message, int color, std::FILE* stream) {
    std::println(stream, "\033[0;{}m  \033[0;1;{}m {}\033[0m", color + 40, color + 30, message);
    std::fflush(stream);
}

void StdioNotifier::state(const std::string& message) {
    print(message, 7, stdout);
}

void StdioNotifier::inform(const std::string& message) {
    print(message, 6, stdout);
}

void StdioNotifier::confirm(const std::string& message) {
    print(message, 2, stdout);
}

void StdioNotifier::alert(const std::string& message) {
    print(message, 1, stderr);
}

FileNotifier::FileNotifier(std::string stateFile, std::string informFile, std::string confirmFile, std::string alertFile)
    : stateFile(std::move(stateFile)),
      informFile(std::move(informFile)),
      confirmFile(std::move(confirmFile)),
      alertFile(std::move(alertFile)) {}

void FileNotifier::append(const std::string& file, const std::string& message) {
    std::ofstream out(file, std::ios::app);
    if (!out.is_open()) {
        std::println(stderr, "Error: Cannot write notification to file: {}", file);
        return;
    }
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    out << std::format("[{}] {}", timeBuf, message) << '\n';
}

void FileNotifier::state(const std::string& message) {
    append(stateFile, message);
}

void FileNotifier::inform(const std::string& message) {
    append(informFile, message);
}

void FileNotifier::confirm(const std::string& message) {
    append(confirmFile, message);
}

void FileNotifier::alert(const std::string& message) {
    append(alertFile, message);
}

CommandNotifier::CommandNotifier(Args stateArgs, Args informArgs, Args confirmArgs, Args alertArgs, Args fallbackArgs)
    : stateArgs(std::move(stateArgs)),
      informArgs(std::move(informArgs)),
      confirmArgs(std::move(confirmArgs)),
      alertArgs(std::move(alertArgs)),
      fallbackArgs(std::move(fallbackArgs)) {
    bool channelMissing = !this->stateArgs || !this->informArgs || !this->confirmArgs || !this->alertArgs;
    if (channelMissing && !this->fallbackArgs) {
        throw std::invalid_argument("A fallback command must be given if one or more channel commands are omitted");
    }
}

void CommandNotifier::call(const Args& args, const std::string& message) {
    const auto& command = args ? *args : *fallbackArgs;
    std::vector<std::string> argv;
    for (auto arg : command) {
        size_t pos = 0;
        while ((pos = arg.find("{message}", pos)) != std::string::npos) {
            arg.replace(pos, 9, message);
            pos += message.size();
        }
        argv.push_back(std::move(arg));
    }

    auto result = runCommand(argv);
    if (!result) {
        std::println(stderr, "Error: Notification command failed: {}", result.error());
    } else if (*result != 0) {
        std::println(stderr, "Error: Notification command `{}` exited with status {}", formatCommand(argv), *result);
    }
}

void CommandNotifier::state(const std::string& message) {
    call(stateArgs, message);
}

void CommandNotifier::inform(const std::string& message) {
    call(informArgs, message);
}

void CommandNotifier::confirm(const std::string& message) {
    call(confirmArgs, message);
}

void CommandNotifier::alert(const std::string& message) {
    call(alertArgs, message);
}

namespace {

std::vector<std::string> notifySendArgs(const std::string& urgency) {
    return {"notify-send", "-c", "linkvault", "-u", urgency, "{message}"};
}

}

NotifySendNotifier::NotifySendNotifier()
    : CommandNotifier(notifySendArgs("low"), notifySendArgs("normal"), notifySendArgs("normal"), notifySendArgs("critical")) {}

TelegramNotifier::TelegramNotifier(std::string botToken, std::string chatId)
    : botToken(std::move(botToken)), chatId(std::move(chatId)) {}

void TelegramNotifier::send(const std::string& channel, const std::string& message) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        std::println(stderr, "Error: Failed to initialize CURL");
        return;
    }

    std::string text = std::format("[{}] {}", channel, message);
    char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.length()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        std::println(stderr, "Error: Failed to escape Telegram message");
        return;
    }
    std::string url = std::format("https://api.telegram.org/bot{}/sendMessage?chat_id={}&text={}",
        botToken, chatId, escaped);
    curl_free(escaped);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::println(stderr, "Error: Failed to send Telegram notification: {}", curl_easy_strerror(res));
    }
    curl_easy_cleanup(curl);
}

void TelegramNotifier::state(const std::string& message) {
    send("state", message);
}

void TelegramNotifier::inform(const std::string& message) {
    send("inform", message);
}

void TelegramNotifier::confirm(const std::string& message) {
    send("confirm", message);
}

void TelegramNotifier::alert(const std::string& message) {
    send("alert", message);
}
