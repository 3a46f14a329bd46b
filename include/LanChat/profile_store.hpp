#ifndef LANCHAT_PROFILE_STORE_HPP
#define LANCHAT_PROFILE_STORE_HPP

#include <optional>
#include <string>
#include <vector>

#include "LanChat/participant.hpp"

inline constexpr const char* PROFILE_SUFFIX = ".profile";

// One "key=value" file per participant in a directory.
class ProfileStore {
public:
    explicit ProfileStore(std::string directory);

    // Throws PersistenceError.
    void save(const Participant& participant) const;

    // nullopt when no profile exists or it has no username.
    std::optional<Participant> load(const std::string& name) const;

    // Names recorded in the profiles, sorted.
    std::vector<std::string> savedNames() const;

    bool remove(const std::string& name) const;

    std::string filePath(const std::string& name) const;

    // Every character outside [A-Za-z0-9] becomes '_'.
    static std::string fileNameFor(const std::string& name);

private:
    std::string directory_;
};

#endif // LANCHAT_PROFILE_STORE_HPP
