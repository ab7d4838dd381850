#include <memory>
#include <string>
#include <stdexcept>


#include <core/modeFactory.hpp>

#include <mode/mode.hpp>
#include <mode/ShuffleMode.hpp>
#include <mode/StreamMode.hpp>

std::unique_ptr<Mode> ModeFactory::create(const std::string& name) {
    if (name == "shuffle") {
        return std::make_unique<ShuffleMode>();
    }
    if (name == "stream") {
        return std::make_unique<StreamMode>();
    }

    throw std::runtime_error("Unknown mode: " + name);
}
