#ifndef DEBUG_SESSION_SESSION_MODE_HPP
#define DEBUG_SESSION_SESSION_MODE_HPP

#include <functional>
#include <string>
#include <vector>

// One of the interchangeable modes a host editor can switch between.
class SessionMode {
public:
    struct Action {
        std::string name;          // identifier passed to UISink::enableAction
        std::string displayName;
        std::string description;
        std::function<void()> handler;

        Action(const std::string& n = "",
               const std::string& d = "",
               const std::string& desc = "",
               std::function<void()> h = nullptr)
            : name(n), displayName(d), description(desc), handler(std::move(h)) {}
    };

    virtual ~SessionMode() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual std::vector<Action> actions() = 0;

    virtual void start() = 0;
    virtual void stop() = 0;
};

#endif // DEBUG_SESSION_SESSION_MODE_HPP
