#include "ContextWindow.hpp"

#include <algorithm>

namespace streaming
{

std::string utf8Tail(const std::string& text, std::size_t max_bytes)
{
    if (text.size() <= max_bytes)
        return text;
    std::size_t start = text.size() - max_bytes;
    while (start < text.size() && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80)
        ++start;
    return text.substr(start);
}

ContextWindow::ContextWindow(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity))
{
}

void ContextWindow::push(ContextEntry entry)
{
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_)
        entries_.pop_front();
}

std::vector<ContextEntry> ContextWindow::entries() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return { entries_.begin(), entries_.end() };
}

std::string ContextWindow::recentCode(std::size_t max_chars, std::size_t before_index) const
{
    std::string joined;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& entry : entries_)
        {
            if (entry.chunk_index >= before_index)
                continue;
            if (!joined.empty())
                joined += '\n';
            joined += entry.content;
        }
    }
    return utf8Tail(joined, max_chars);
}

std::size_t ContextWindow::size() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

std::size_t ContextWindow::byteSize() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t bytes = 0;
    for (const auto& entry : entries_)
        bytes += entry.content.size();
    return bytes;
}

void ContextWindow::clear()
{
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.clear();
}

} // namespace streaming
