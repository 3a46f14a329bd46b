#include "LanChat/participant.hpp"

#include <utility>

Participant::Participant(std::string name, std::string address)
    : name_(std::move(name)),
      address_(std::move(address)) {}

Participant::Participant(std::string name, std::string address, bool online, std::string avatar)
    : name_(std::move(name)),
      address_(std::move(address)),
      online_(online),
      avatar_(std::move(avatar)) {}

bool Participant::operator==(const Participant& other) const noexcept {
    return name_ == other.name_ && address_ == other.address_;
}

std::string Participant::toString() const {
    return name_ + (online_ ? " (Online)" : " (Offline)");
}
