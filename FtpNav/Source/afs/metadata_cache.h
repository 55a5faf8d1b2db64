// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef METADATA_CACHE_H_2384750928347502934
#define METADATA_CACHE_H_2384750928347502934

#include <list>
#include <optional>
#include <unordered_map>
#include "../base/remote_session.h"


namespace fnav
{
//item metadata by server path; least recently used entries are dropped first
//not thread-safe: owned by a single session
class MetadataCache
{
public:
    explicit MetadataCache(size_t capacity) : capacity_(capacity) {}

    void setCapacity(size_t capacity)
    {
        capacity_ = capacity;
        shrink();
    }
    size_t getCapacity() const { return capacity_; }
    size_t size() const { return itemList_.size(); }

    void insert(const Zstring& itemPath, const RemoteItem& item)
    {
        if (auto it = itemIndex_.find(itemPath);
            it != itemIndex_.end())
        {
            it->second->second = item;
            itemList_.splice(itemList_.end(), itemList_, it->second); //mark as most recent
            return;
        }

        itemList_.emplace_back(itemPath, item);
        itemIndex_.emplace(itemPath, std::prev(itemList_.end()));
        shrink();
    }

    std::optional<RemoteItem> find(const Zstring& itemPath)
    {
        auto it = itemIndex_.find(itemPath);
        if (it == itemIndex_.end())
            return {};

        itemList_.splice(itemList_.end(), itemList_, it->second);
        return it->second->second;
    }

    //drop item and everything below it
    void erase(const Zstring& itemPath)
    {
        const Zstring folderPrefix = zen::endsWith(itemPath, Zstr('/')) ? itemPath : itemPath + Zstr('/');

        for (auto it = itemList_.begin(); it != itemList_.end();)
            if (it->first == itemPath || zen::startsWith(it->first, folderPrefix))
            {
                itemIndex_.erase(it->first);
                it = itemList_.erase(it);
            }
            else
                ++it;
    }

    void clear()
    {
        itemIndex_.clear();
        itemList_.clear();
    }

private:
    void shrink()
    {
        while (itemList_.size() > capacity_)
        {
            itemIndex_.erase(itemList_.front().first); //remove oldest element
            itemList_.pop_front();
        }
    }

    using ItemList = std::list<std::pair<Zstring /*server path*/, RemoteItem>>; //sorted by time of last access

    size_t capacity_;
    ItemList itemList_;
    std::unordered_map<Zstring, ItemList::iterator> itemIndex_;
};
}

#endif //METADATA_CACHE_H_2384750928347502934
