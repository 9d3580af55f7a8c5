#include "IShutdownable.hpp"

#include <plog/Log.h>

#include <exception>

namespace utils
{

void ShutdownSequence::add(std::string name, std::function<void()> step)
{
    steps_.emplace_back(std::move(name), std::move(step));
}

void ShutdownSequence::add(IShutdownable& component)
{
    steps_.emplace_back(component.Name(), [&component]() { component.Shutdown(); });
}

bool ShutdownSequence::run()
{
    if (ran_)
        return false;
    ran_ = true;

    for (auto& [name, step] : steps_)
    {
        try
        {
            step();
            PLOG_DEBUG << "[Shutdown] " << name << " stopped";
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "[Shutdown] " << name << " failed: " << ex.what();
            failures_.push_back(name + ": " + ex.what());
        }
    }
    return true;
}

} // namespace utils
