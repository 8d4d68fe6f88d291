#pragma once

#include "board/history/undo_types.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace board {

// Snapshot based undo/redo store for objects of type T.
//
// Objects are tracked by a key assigned at insert(). The first saveForUndo()
// of an object after a boundary stores a copy of it; undo() swaps that copy
// back in, so the live instance of a key changes across undo and redo. Owners
// holding their own handles resynchronise through startReadObject() and
// readObject(), which walk the objects touched by the last undo/redo that are
// alive afterwards, in insertion order.
//
// The stack level starts at 0 and every generateSnapshot() opens a new level.
// Changes made at level 0 are never recorded.
template <typename T>
class UndoLog {
public:
    using ObjectPtr = std::shared_ptr<T>;

    class ReadIterator {
    private:
        friend class UndoLog;
        std::size_t pos_ = 0;
    };

    UndoLog() = default;
    UndoLog(const UndoLog&) = delete;
    UndoLog& operator=(const UndoLog&) = delete;

    void insert(ObjectPtr object) {
        if (!object) {
            throw std::invalid_argument("UndoLog::insert: null object");
        }
        if (keyOf_.find(object.get()) != keyOf_.end()) {
            throw std::invalid_argument("UndoLog::insert: object is already tracked");
        }
        disableRedo();
        const std::uint32_t key = static_cast<std::uint32_t>(objects_.size());
        keyOf_.emplace(object.get(), key);
        objects_.push_back(std::move(object));

        UndoEntry<T>* entry = openEntry();
        if (!entry) return;
        UndoObjectChange<T> change{};
        change.key = key;
        entry->objectIndex.emplace(key, entry->objects.size());
        entry->objects.push_back(std::move(change));
    }

    // Must be called before the object is modified.
    void saveForUndo(const T& object) {
        const auto it = keyOf_.find(&object);
        if (it == keyOf_.end()) {
            throw std::invalid_argument("UndoLog::saveForUndo: object is not tracked");
        }
        disableRedo();
        UndoEntry<T>* entry = openEntry();
        if (!entry) return;

        if (!entry->objectIndex.emplace(it->second, entry->objects.size()).second) return;
        UndoObjectChange<T> change{};
        change.key = it->second;
        change.before = std::make_shared<T>(object);
        entry->objects.push_back(std::move(change));
    }

    void generateSnapshot() {
        disableRedo();
        history_.emplace_back();
        cursor_ = history_.size();
    }

    // Returns false at stack level 0. The optional lists receive the instances
    // taken out of and put into the log by this step.
    bool undo(std::vector<ObjectPtr>* cancelled, std::vector<ObjectPtr>* restored) {
        if (cursor_ == 0) return false;
        cursor_--;
        applyEntry(history_[cursor_], false, cancelled, restored);
        return true;
    }

    bool redo(std::vector<ObjectPtr>* cancelled, std::vector<ObjectPtr>* restored) {
        if (cursor_ >= history_.size()) return false;
        const std::size_t index = cursor_;
        cursor_++;
        applyEntry(history_[index], true, cancelled, restored);
        return true;
    }

    ReadIterator startReadObject() const noexcept { return ReadIterator{}; }

    // Next object replayed by the last undo/redo, or null at the end.
    ObjectPtr readObject(ReadIterator& it) const {
        while (it.pos_ < replay_.size()) {
            const ObjectPtr& object = objects_[replay_[it.pos_++]];
            if (object) return object;
        }
        return nullptr;
    }

    bool contains(const T& object) const { return keyOf_.find(&object) != keyOf_.end(); }
    std::size_t size() const noexcept { return keyOf_.size(); }
    bool canUndo() const noexcept { return cursor_ > 0; }
    bool canRedo() const noexcept { return cursor_ < history_.size(); }
    std::size_t getStackLevel() const noexcept { return cursor_; }

    void clear() {
        objects_.clear();
        keyOf_.clear();
        history_.clear();
        cursor_ = 0;
        replay_.clear();
    }

private:
    UndoEntry<T>* openEntry() noexcept {
        return cursor_ == 0 ? nullptr : &history_[cursor_ - 1];
    }

    void disableRedo() {
        if (cursor_ < history_.size()) {
            history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
        }
    }

    void applyEntry(UndoEntry<T>& entry, bool useAfter, std::vector<ObjectPtr>* cancelled, std::vector<ObjectPtr>* restored) {
        std::sort(entry.objects.begin(), entry.objects.end(), [](const UndoObjectChange<T>& a, const UndoObjectChange<T>& b) {
            return a.key < b.key;
        });
        entry.objectIndex.clear();
        for (std::size_t i = 0; i < entry.objects.size(); ++i) {
            entry.objectIndex.emplace(entry.objects[i].key, i);
        }

        replay_.clear();
        for (auto& change : entry.objects) {
            if (!useAfter) {
                change.after = objects_[change.key];
            }
            const ObjectPtr& target = useAfter ? change.after : change.before;
            ObjectPtr previous = std::move(objects_[change.key]);
            if (previous) {
                keyOf_.erase(previous.get());
                if (cancelled) cancelled->push_back(previous);
            }
            if (target) {
                keyOf_[target.get()] = change.key;
                if (restored) restored->push_back(target);
                replay_.push_back(change.key);
            }
            objects_[change.key] = target;
        }
    }

    std::vector<ObjectPtr> objects_; // by key, null while not alive
    std::unordered_map<const T*, std::uint32_t> keyOf_;
    std::vector<UndoEntry<T>> history_;
    std::size_t cursor_ = 0;
    std::vector<std::uint32_t> replay_;
};

} // namespace board
