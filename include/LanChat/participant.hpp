#ifndef LANCHAT_PARTICIPANT_HPP
#define LANCHAT_PARTICIPANT_HPP

#include <cstddef>
#include <functional>
#include <string>

inline constexpr const char* DEFAULT_AVATAR   = "default_avatar.png";
inline constexpr const char* UNKNOWN_ADDRESS  = "0.0.0.0";

class Participant {
public:
    Participant() = default;
    Participant(std::string name, std::string address);
    Participant(std::string name, std::string address, bool online, std::string avatar);

    const std::string& name() const noexcept { return name_; }
    const std::string& address() const noexcept { return address_; }
    bool online() const noexcept { return online_; }
    const std::string& avatar() const noexcept { return avatar_; }

    // Changes the identity: only valid before the participant is bound
    // to a connection or stored in a session.
    void setAddress(std::string address) { address_ = std::move(address); }

    void setOnline(bool online) noexcept { online_ = online; }
    void setAvatar(std::string avatar) { avatar_ = std::move(avatar); }

    // Identity is (name, address). Online state and avatar are ignored.
    bool operator==(const Participant& other) const noexcept;
    bool operator!=(const Participant& other) const noexcept { return !(*this == other); }

    std::string toString() const;

private:
    std::string name_{"Anonymous"};
    std::string address_{"127.0.0.1"};
    bool online_{false};
    std::string avatar_{DEFAULT_AVATAR};
};

namespace std {

template <>
struct hash<Participant> {
    std::size_t operator()(const Participant& p) const noexcept {
        const std::size_t h1 = std::hash<std::string>{}(p.name());
        const std::size_t h2 = std::hash<std::string>{}(p.address());
        return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
    }
};

} // namespace std

#endif // LANCHAT_PARTICIPANT_HPP
