#include "stages/stage.hpp"
#include <iostream>

#include <utility>

namespace psp {

Stage::Stage(std::string name)
    : name_(std::move(name)), runner_(name_) {}

Stage::~Stage() = default;

void Stage::start(StopToken global_stop) {
  std::cout << "[" << name_ << "] started" << std::endl;
  started_ = true;

  runner_.start(global_stop, [this](const StopToken& g, const std::atomic_bool& l) {
    run(g, l);
  });
}

void Stage::stop() {
  if (!started_) return;
  started_ = false;

  runner_.request_stop();
  try {
    runner_.join();
  } catch (const std::exception& e) {
    std::cerr << "[" << name_ << "] loop failed: " << e.what() << std::endl;
    throw;
  }

  std::cout << "[" << name_ << "] stopped" << std::endl;
}

} // namespace psp
