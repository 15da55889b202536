#include <blake3.h>
#include <crowdfund/blake3/hash.hpp>

namespace crowdfund::blake3 {

namespace {

class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  void update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state_, data, size);
  }

  crowdfund::schema::hash32_t finalize() {
    auto output = crowdfund::schema::hash32_t{};
    static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<decltype(output)>);
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

crowdfund::schema::hash32_t hash(const std::string_view& str) {
  auto h = hasher{};
  h.update(str.data(), str.size());
  return h.finalize();
}

crowdfund::schema::hash32_t hash(const crowdfund::schema::bytes_view_t& bytes) {
  auto h = hasher{};
  h.update(bytes.data(), bytes.size());
  return h.finalize();
}

crowdfund::schema::hash32_t hash(
    std::initializer_list<crowdfund::schema::bytes_view_t> parts) {
  auto h = hasher{};
  for (const auto& part : parts) {
    h.update(part.data(), part.size());
  }
  return h.finalize();
}

}  // namespace crowdfund::blake3
