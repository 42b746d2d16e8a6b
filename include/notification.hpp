/**
 * @file notification.hpp
 * @brief Defines notifiers for LinkVault.
 *
 * Every notifier exposes four severity channels. The orchestrator decides which channel a
 * message goes to; notifiers only decide how it is rendered or delivered.
 *
 * @note TelegramNotifier requires libcurl.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Interface for notifiers.
 *
 * Delivery failures are reported to stderr by the implementation. No channel throws.
 */
class Notifier {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~Notifier() = default;

    /**
     * @brief Sends a progress marker that may be ignored.
     */
    virtual void state(const std::string& message) = 0;

    /**
     * @brief Sends user-relevant progress.
     */
    virtual void inform(const std::string& message) = 0;

    /**
     * @brief Sends a success or outcome summary.
     */
    virtual void confirm(const std::string& message) = 0;

    /**
     * @brief Sends an error that requires attention.
     */
    virtual void alert(const std::string& message) = 0;
};

/**
 * @brief Notifier that forwards every message to a list of notifiers, in order.
 */
class GroupedNotifier : public Notifier {
public:
    explicit GroupedNotifier(std::vector<std::unique_ptr<Notifier>> notifiers);

    void state(const std::string& message) override;
    void inform(const std::string& message) override;
    void confirm(const std::string& message) override;
    void alert(const std::string& message) override;

    const std::vector<std::unique_ptr<Notifier>>& notifiers() const { return notifiers_; }

private:
    std::vector<std::unique_ptr<Notifier>> notifiers_; ///< Grouped notifiers.
};

/**
 * @brief Notifier that prints colored lines to stdout, and alerts to stderr.
 */
class StdioNotifier : public Notifier {
public:
    void state(const std::string& message) override;
    void inform(const std::string& message) override;
    void confirm(const std::string& message) override;
    void alert(const std::string& message) override;

private:
    void print(const std::string& message, int color, std::FILE* stream);
};

/**
 * @brief Notifier that appends timestamped lines to one file per channel.
 */
class FileNotifier : public Notifier {
public:
    /**
     * @brief Constructs a file notifier.
     *
     * Several channels may share a file.
     *
     * @param stateFile File for state messages.
     * @param informFile File for inform messages.
     * @param confirmFile File for confirm messages.
     * @param alertFile File for alert messages.
     */
    FileNotifier(std::string stateFile, std::string informFile, std::string confirmFile, std::string alertFile);

    void state(const std::string& message) override;
    void inform(const std::string& message) override;
    void confirm(const std::string& message) override;
    void alert(const std::string& message) override;

private:
    void append(const std::string& file, const std::string& message);

    std::string stateFile;   ///< Destination of state messages.
    std::string informFile;  ///< Destination of inform messages.
    std::string confirmFile; ///< Destination of confirm messages.
    std::string alertFile;   ///< Destination of alert messages.
};

/**
 * @brief Notifier that runs a command per message.
 *
 * Every occurrence of "{message}" in the arguments is replaced with the message.
 */
class CommandNotifier : public Notifier {
public:
    using Args = std::optional<std::vector<std::string>>;

    /**
     * @brief Constructs a command notifier.
     *
     * @param stateArgs Command for state messages.
     * @param informArgs Command for inform messages.
     * @param confirmArgs Command for confirm messages.
     * @param alertArgs Command for alert messages.
     * @param fallbackArgs Command for every channel without its own command.
     * @throws std::invalid_argument If a channel has no command and no fallback is given.
     */
    CommandNotifier(Args stateArgs, Args informArgs, Args confirmArgs, Args alertArgs, Args fallbackArgs = std::nullopt);

    void state(const std::string& message) override;
    void inform(const std::string& message) override;
    void confirm(const std::string& message) override;
    void alert(const std::string& message) override;

private:
    void call(const Args& args, const std::string& message);

    Args stateArgs;
    Args informArgs;
    Args confirmArgs;
    Args alertArgs;
    Args fallbackArgs;
};

/**
 * @brief Desktop notifications through notify-send.
 */
class NotifySendNotifier : public CommandNotifier {
public:
    NotifySendNotifier();
};

/**
 * @brief Telegram notifier.
 *
 * Sends every message to a chat through the Telegram Bot API, prefixed with its channel.
 */
class TelegramNotifier : public Notifier {
public:
    /**
     * @brief Constructs a Telegram notifier.
     *
     * @param botToken Telegram bot token.
     * @param chatId Telegram chat ID.
     */
    TelegramNotifier(std::string botToken, std::string chatId);

    void state(const std::string& message) override;
    void inform(const std::string& message) override;
    void confirm(const std::string& message) override;
    void alert(const std::string& message) override;

private:
    void send(const std::string& channel, const std::string& message);

    std::string botToken; ///< Telegram bot token.
    std::string chatId;   ///< Telegram chat ID.
};

#endif // NOTIFICATION_HPP
