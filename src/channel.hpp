#pragma once
#include <functional>
#include <string>

// ── MessageChannel ────────────────────────────────────────────────────────
// Topic based publish/subscribe carrying JSON text.
// Handler: (topic, json) in, JSON reply out.
using CommandHandler = std::function<void(const std::string& topic,
                                          const std::string& json,
                                          std::string& reply)>;

class MessageChannel {
public:
    virtual ~MessageChannel() = default;

    // false = unavailable (not running, nobody subscribed, send failed)
    virtual bool publish(const std::string& topic, const std::string& json) = 0;

    // Set before the channel starts delivering
    virtual void set_command_handler(CommandHandler h) = 0;
};
