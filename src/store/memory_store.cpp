#include <algorithm>

#include "store/store.hpp"
#include "util/log.hpp"

namespace store
{

bool MemoryStore::save(const payload::LogicalPayload &p)
{
    std::lock_guard<std::mutex> lock(mu_);
    items_.push_back(p);
    LOG_DEBUG("MemoryStore::save: %zu item(s) held", items_.size());
    return true;
}

std::vector<payload::LogicalPayload> MemoryStore::items() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return items_;
}

std::size_t MemoryStore::size() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
}

bool MemoryContactBook::add_or_update(const payload::Signature &s, std::int64_t now)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = std::find_if(contacts_.begin(), contacts_.end(),
                           [&](const Contact &c) { return c.signature == s; });
    if (it != contacts_.end())
    {
        it->last_seen = now;
        it->message_count++;
        return false;
    }
    Contact c;
    c.signature     = s;
    c.first_seen    = now;
    c.last_seen     = now;
    c.message_count = 1;
    contacts_.insert(contacts_.begin(), std::move(c));
    return true;
}

bool MemoryContactBook::is_contact(const payload::Signature &s) const
{
    return find(s).has_value();
}

std::optional<Contact> MemoryContactBook::find(const payload::Signature &s) const
{
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto &c : contacts_)
    {
        if (c.signature == s)
            return c;
    }
    return std::nullopt;
}

bool MemoryContactBook::remove(const payload::Signature &s)
{
    std::lock_guard<std::mutex> lock(mu_);
    const auto before = contacts_.size();
    contacts_.erase(std::remove_if(contacts_.begin(), contacts_.end(),
                                   [&](const Contact &c) { return c.signature == s; }),
                    contacts_.end());
    return contacts_.size() != before;
}

std::size_t MemoryContactBook::count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return contacts_.size();
}

}  // namespace store
