#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

// Tracks which prompt triggers have already been answered. Each
// trigger fires at most once, on the first scan that finds it.
class AutoResponder {
public:
    AutoResponder(std::map<std::string, std::string> required,
                  std::map<std::string, std::string> optional = {})
        : required_(std::move(required)), optional_(std::move(optional)) {}

    // Returns the responses due for triggers newly present in output
    std::vector<std::string> scan(const std::string& output) {
        std::vector<std::string> due;
        collect(required_, output, due);
        collect(optional_, output, due);
        return due;
    }

    bool allRequiredFired() const {
        for (auto& [trigger, _] : required_)
            if (!fired_.count(trigger)) return false;
        return true;
    }

    bool hasFired(const std::string& trigger) const {
        return fired_.count(trigger) > 0;
    }

    size_t firedCount() const { return fired_.size(); }

private:
    void collect(const std::map<std::string, std::string>& triggers,
                 const std::string& output,
                 std::vector<std::string>& due) {
        for (auto& [trigger, response] : triggers) {
            if (fired_.count(trigger)) continue;
            if (output.find(trigger) == std::string::npos) continue;
            fired_.insert(trigger);
            due.push_back(response);
        }
    }

    std::map<std::string, std::string> required_;
    std::map<std::string, std::string> optional_;
    std::set<std::string> fired_;
};
