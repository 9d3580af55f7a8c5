#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace streaming
{

struct ContextEntry
{
    std::size_t chunk_index = 0;
    std::string content;
    nlohmann::json metadata = nlohmann::json::object();
};

// Bounded carry-forward of recently translated code. Oldest entries are
// evicted first.
class ContextWindow
{
public:
    static constexpr std::size_t kDefaultCapacity = 10;

    explicit ContextWindow(std::size_t capacity = kDefaultCapacity);

    void push(ContextEntry entry);
    std::vector<ContextEntry> entries() const;

    // Contents of entries from chunks before before_index, joined by
    // newlines, keeping only the last max_chars bytes.
    std::string recentCode(std::size_t max_chars, std::size_t before_index) const;

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::size_t byteSize() const;
    void clear();

private:
    std::size_t capacity_;
    mutable std::mutex mtx_;
    std::deque<ContextEntry> entries_;
};

// Last max_bytes of text, advanced past any leading UTF-8 continuation bytes.
std::string utf8Tail(const std::string& text, std::size_t max_bytes);

} // namespace streaming
