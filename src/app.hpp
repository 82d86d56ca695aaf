#pragma once

#include <memory>
#include <string>

class Config;

class App {
public:
    /// notice is shown in the update banner until the first check, e.g. "Updated to version 1.3.0"
    explicit App(const Config& config, const std::string& notice = "");
    ~App();

    void run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
