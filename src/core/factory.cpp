#include <idforge/factory.hpp>
#include <idforge/log.hpp>

namespace idforge {

IdFactory::IdFactory(FactoryConfig cfg, const Clock& clock, RandomSource& random)
    : cfg_(std::move(cfg)), clock_(clock), random_(random) {
    log::debug("id factory: name version %d, v8 hash %s",
               cfg_.name_version, hash_algorithm_name(cfg_.v8_hash));
}

Result<Uuid> IdFactory::from_name(const Uuid& namespace_id, std::string_view name) const {
    return create_from_name(namespace_id, name, cfg_.name_version);
}

Result<Uuid> IdFactory::from_name(const Uuid& namespace_id, std::string_view name,
                                  int version) const {
    return create_from_name(namespace_id, name, version);
}

Result<Uuid> IdFactory::v4() const {
    return create_v4(random_);
}

Result<Uuid> IdFactory::v6() const {
    return create_v6(std::nullopt, clock_, random_);
}

Result<Uuid> IdFactory::v6(Timestamp ts) const {
    return create_v6(ts, clock_, random_);
}

Result<Uuid> IdFactory::v7() const {
    return create_v7(std::nullopt, clock_, random_);
}

Result<Uuid> IdFactory::v7(Timestamp ts) const {
    return create_v7(ts, clock_, random_);
}

Result<Uuid> IdFactory::v8(const std::vector<uint8_t>& data) const {
    return create_v8(data);
}

Result<Uuid> IdFactory::v8_from_name(const Uuid& namespace_id,
                                     std::string_view name) const {
    return create_v8_from_name(cfg_.v8_hash, namespace_id, name);
}

} // namespace idforge
