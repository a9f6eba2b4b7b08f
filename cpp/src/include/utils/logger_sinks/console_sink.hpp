#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>

namespace treespec::utils
{

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_logmsg(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace treespec::utils
