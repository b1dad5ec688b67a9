#pragma once

#include "strata/world/material.hpp"

#include <map>
#include <string>
#include <string_view>

namespace strata::world {

class INameResolver {
public:
    virtual ~INameResolver() = default;

    // Canonical block name for `name`; unknown names come back unchanged.
    virtual std::string correct(std::string_view name) const = 0;
};

// Looks names up in an alias table after normalizing case, whitespace and
// the "minecraft:" namespace. Names without an alias are returned verbatim.
class AliasNameResolver final : public INameResolver {
public:
    AliasNameResolver();
    explicit AliasNameResolver(std::map<std::string, std::string> aliases);

    std::string correct(std::string_view name) const override;

    void add_alias(std::string alias, std::string canonical);
    [[nodiscard]] const std::map<std::string, std::string>& aliases() const noexcept { return aliases_; }

private:
    std::map<std::string, std::string> aliases_;
};

std::map<std::string, std::string> default_block_aliases();

// Material with its name passed through the resolver; properties unchanged.
Material resolve(const INameResolver& resolver, const Material& material);

} // namespace strata::world
