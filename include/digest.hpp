#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace zxboot {

// Checks a downloaded image before control is transferred to it.
class ImageVerifier {
public:
    virtual ~ImageVerifier() = default;
    virtual void update(const uint8_t* data, size_t len) = 0;
    virtual bool verify() = 0;
};

#ifdef ZXBOOT_HAVE_SODIUM
// BLAKE2b-256 over the whole file, compared in constant time.
class Blake2bVerifier : public ImageVerifier {
public:
    static constexpr size_t kDigestSize = 32;

    explicit Blake2bVerifier(const std::vector<uint8_t>& expected);
    ~Blake2bVerifier() override;
    Blake2bVerifier(const Blake2bVerifier&) = delete;
    Blake2bVerifier& operator=(const Blake2bVerifier&) = delete;
    void update(const uint8_t* data, size_t len) override;
    bool verify() override;
private:
    std::vector<uint8_t> expected_;
    void* state_{nullptr};   // crypto_generichash_state, sodium_malloc'd
    bool finalized_{false};
};
#endif

} // namespace zxboot
