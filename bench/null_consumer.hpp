#pragma once
#include "compose_track/logs/log_consumer.hpp"
#include <cstddef>

namespace ctrack {

class NullLogConsumer : public ILogConsumer {
public:
    NullLogConsumer() : m_count(0) {}
    void log(const std::string&, const std::string&) override { ++m_count; }
    size_t count() const { return m_count; }

private:
    size_t m_count;
};

} // namespace ctrack
