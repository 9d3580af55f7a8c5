#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace utils
{

/**
 * @brief Component that owns threads or collaborator state and must be torn down
 *
 * Shutdown() must be safe to call more than once; only the first call does work.
 */
class IShutdownable
{
public:
    virtual ~IShutdownable() = default;

    virtual const char* Name() const = 0;
    virtual void Shutdown() = 0;
};

/**
 * @brief Ordered teardown list, executed exactly once
 *
 * Steps run in registration order. A step that throws is logged and the
 * remaining steps still run.
 */
class ShutdownSequence
{
public:
    void add(std::string name, std::function<void()> step);
    void add(IShutdownable& component);

    // Returns false when the sequence already ran.
    bool run();

    bool hasRun() const { return ran_; }
    const std::vector<std::string>& failures() const { return failures_; }

private:
    std::vector<std::pair<std::string, std::function<void()>>> steps_;
    std::vector<std::string> failures_;
    bool ran_ = false;
};

} // namespace utils
