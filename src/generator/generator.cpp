#include "generator/generator.hpp"
#include "core/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>

#include <unistd.h>

namespace uuidpp {

namespace {

void put_uint32(uint8_t* out, uint32_t value) {
    out[0] = static_cast<uint8_t>(value >> 24);
    out[1] = static_cast<uint8_t>(value >> 16);
    out[2] = static_cast<uint8_t>(value >> 8);
    out[3] = static_cast<uint8_t>(value);
}

void put_uint16(uint8_t* out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value >> 8);
    out[1] = static_cast<uint8_t>(value);
}

// Fields shared by versions 1 and 2: time_mid, time_hi, clock_seq and node
void put_time_fields(Uuid& uuid, const TimeSnapshot& snapshot) {
    put_uint16(uuid.data() + 4, static_cast<uint16_t>(snapshot.timestamp >> 32));
    put_uint16(uuid.data() + 6, static_cast<uint16_t>(snapshot.timestamp >> 48));
    put_uint16(uuid.data() + 8, snapshot.clock_sequence);
    std::copy(snapshot.node.begin(), snapshot.node.end(), uuid.data() + 10);
}

Uuid from_hash(const EVP_MD* md, const Uuid& ns, std::string_view name) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw DigestError("EVP_MD_CTX_new");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), ns.data(), Uuid::kSize) != 1 ||
        EVP_DigestUpdate(ctx.get(), name.data(), name.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw DigestError(EVP_MD_name(md));
    }

    Uuid uuid;
    std::copy(digest, digest + std::min<size_t>(digest_len, Uuid::kSize), uuid.data());
    return uuid;
}

} // anonymous namespace

PosixIdentity current_posix_identity() {
    PosixIdentity identity;
    identity.uid = static_cast<uint32_t>(::getuid());
    identity.gid = static_cast<uint32_t>(::getgid());
    return identity;
}

Generator::Generator(GenerationState& state, PosixIdentity identity)
    : state_(state), identity_(identity) {}

Uuid Generator::new_v1() {
    const TimeSnapshot snapshot = state_.advance();

    Uuid uuid;
    put_uint32(uuid.data(), static_cast<uint32_t>(snapshot.timestamp));
    put_time_fields(uuid, snapshot);

    uuid.set_version(1);
    uuid.set_variant();
    return uuid;
}

Uuid Generator::new_v2(Domain domain) {
    const TimeSnapshot snapshot = state_.advance();

    Uuid uuid;
    if (domain == Domain::Person) {
        put_uint32(uuid.data(), identity_.uid);
    } else if (domain == Domain::Group) {
        put_uint32(uuid.data(), identity_.gid);
    }
    put_time_fields(uuid, snapshot);
    uuid[9] = static_cast<uint8_t>(domain);

    uuid.set_version(2);
    uuid.set_variant();
    return uuid;
}

Uuid Generator::new_v3(const Uuid& ns, std::string_view name) const {
    Uuid uuid = from_hash(EVP_md5(), ns, name);
    uuid.set_version(3);
    uuid.set_variant();
    return uuid;
}

Uuid Generator::new_v4() {
    Uuid uuid;
    secure_random(state_.entropy(), uuid.data(), Uuid::kSize);
    uuid.set_version(4);
    uuid.set_variant();
    return uuid;
}

Uuid Generator::new_v5(const Uuid& ns, std::string_view name) const {
    Uuid uuid = from_hash(EVP_sha1(), ns, name);
    uuid.set_version(5);
    uuid.set_variant();
    return uuid;
}

Uuid Generator::new_time(std::chrono::system_clock::time_point time) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch());
    const uint64_t stamp = static_cast<uint64_t>(seconds.count()) << 24;

    Uuid uuid;
    for (size_t i = 0; i < 5; ++i) {
        uuid[i] = static_cast<uint8_t>(stamp >> (56 - 8 * i));
    }
    secure_random(state_.entropy(), uuid.data() + 5, Uuid::kSize - 5);

    uuid.set_version(6);
    uuid.set_variant();
    return uuid;
}

Uuid Generator::new_time() {
    return new_time(std::chrono::system_clock::now());
}

Generator& default_generator() {
    static Generator generator(GenerationState::instance());
    return generator;
}

Uuid new_v1() { return default_generator().new_v1(); }
Uuid new_v2(Domain domain) { return default_generator().new_v2(domain); }
Uuid new_v3(const Uuid& ns, std::string_view name) { return default_generator().new_v3(ns, name); }
Uuid new_v4() { return default_generator().new_v4(); }
Uuid new_v5(const Uuid& ns, std::string_view name) { return default_generator().new_v5(ns, name); }
Uuid new_time(std::chrono::system_clock::time_point time) { return default_generator().new_time(time); }
Uuid new_time() { return default_generator().new_time(); }

} // namespace uuidpp
