#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "proto/payload.hpp"

namespace store
{

// Persistence collaborator: receives a fully reconstructed payload when the
// receiver keeps it (Permanent open or explicit save).
struct IMessageStore
{
    virtual bool save(const payload::LogicalPayload &p) = 0;
    virtual ~IMessageStore()                              = default;
};

// Contacts registry fed by signed payloads. Injected, never ambient.
struct Contact
{
    payload::Signature signature;
    std::int64_t       first_seen{0};  // unix seconds
    std::int64_t       last_seen{0};
    std::size_t        message_count{0};
};

struct IContactBook
{
    // true when the sender was not known before
    virtual bool                   add_or_update(const payload::Signature &s, std::int64_t now) = 0;
    virtual bool                   is_contact(const payload::Signature &s) const                = 0;
    virtual std::optional<Contact> find(const payload::Signature &s) const                      = 0;
    virtual bool                   remove(const payload::Signature &s)                          = 0;
    virtual std::size_t            count() const                                                = 0;
    virtual ~IContactBook()                                                                     = default;
};

class MemoryStore final : public IMessageStore
{
  public:
    bool                                 save(const payload::LogicalPayload &p) override;
    std::vector<payload::LogicalPayload> items() const;
    std::size_t                          size() const;

  private:
    mutable std::mutex                   mu_;
    std::vector<payload::LogicalPayload> items_;
};

class MemoryContactBook final : public IContactBook
{
  public:
    bool                   add_or_update(const payload::Signature &s, std::int64_t now) override;
    bool                   is_contact(const payload::Signature &s) const override;
    std::optional<Contact> find(const payload::Signature &s) const override;
    bool                   remove(const payload::Signature &s) override;
    std::size_t            count() const override;

  private:
    mutable std::mutex   mu_;
    std::vector<Contact> contacts_;  // newest first
};

}  // namespace store
