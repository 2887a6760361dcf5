#pragma once

// Name:      lazy_sequence.hpp
// Copyright: The Sift Authors 2025
//
// LazySequence<T> is a fixed-size, indexed sequence whose elements are produced on demand by a factory function and
// cached per position.  It is the common engine behind Groups and MatchCollection.
//
// Three access modes are supported and agree on every element:
//
//   Iteration:     LazyCursor<T> / LazyIterator<T>, restartable, populates the cache.
//   Random access: get(), operator[], at(), populates the cache.
//   Bulk:          as_array(), built from the factory alone and never reads or writes the cache.
//
// The cache is cleared by clear_cache() or by a broadcast of EVENT::LOW_MEMORY.

#include <sift/main.h>

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sift {

template <class T> class LazyCursor;
template <class T> class LazyIterator;

template <class T> class LazySequence {
   public:
      typedef std::optional<T> value_type;
      typedef std::function<value_type(size_t)> FACTORY;
      typedef std::shared_ptr<const value_type> ELEMENT;

   private:
      const size_t total;
      FACTORY factory;
      mutable std::mutex mutex;
      mutable std::vector<ELEMENT> cache;
      APTR event_handle = nullptr;

   public:
      LazySequence(size_t Size, FACTORY Factory) : total(Size), factory(std::move(Factory)), cache(Size) {
         if (SubscribeEvent(EVENT::LOW_MEMORY, [this](EVENT) { clear_cache(); }, &event_handle) != ERR::Okay) {
            Log log("LazySequence");
            log.warning("Unable to subscribe to low memory events.");
            event_handle = nullptr;
         }
      }

      ~LazySequence() {
         if (event_handle) UnsubscribeEvent(event_handle);
      }

      LazySequence(const LazySequence &) = delete;
      LazySequence & operator=(const LazySequence &) = delete;

      inline size_t size() const { return total; }
      inline bool empty() const { return total IS 0; }
      inline size_t start_index() const { return 0; }
      inline size_t end_index() const { return total; }
      inline size_t index_after(size_t Index) const { return Index + 1; }

      // Produce the element at Index without consulting the cache.

      value_type make(size_t Index) const {
         return factory(Index);
      }

      // Return the cached element at Index, materialising it if the slot is empty.  The same instance is returned on
      // every call until the cache is cleared.  The factory runs outside of the lock; if another thread fills the slot
      // first, its value is kept and ours is discarded.

      ELEMENT get(size_t Index) const {
         {
            std::lock_guard lock(mutex);
            if (cache[Index]) return cache[Index];
         }

         auto element = std::make_shared<const value_type>(factory(Index));

         ELEMENT discard;
         std::lock_guard lock(mutex);
         if (cache[Index]) {
            discard = std::move(element);
            return cache[Index];
         }
         cache[Index] = element;
         return element;
      }

      // Unchecked access; Index must be within [start_index(), end_index()).

      value_type operator[](size_t Index) const {
         return *get(Index);
      }

      value_type at(size_t Index) const {
         if (Index >= total) throw std::out_of_range("LazySequence index " + std::to_string(Index) + " is out of range");
         return *get(Index);
      }

      // Every element that has a value, in order, built from scratch.

      std::vector<T> as_array() const {
         std::vector<T> result;
         result.reserve(total);
         for (size_t i=0; i < total; i++) {
            if (auto element = factory(i)) result.push_back(std::move(*element));
         }
         return result;
      }

      bool cached(size_t Index) const {
         std::lock_guard lock(mutex);
         return (Index < total) and (cache[Index] != nullptr);
      }

      size_t cached_count() const {
         std::lock_guard lock(mutex);
         size_t count = 0;
         for (auto &element : cache) if (element) count++;
         return count;
      }

      // Released elements are destroyed after the lock is dropped, as their destructors may need the event lock.

      void clear_cache() const {
         std::vector<ELEMENT> released(total);
         std::lock_guard lock(mutex);
         cache.swap(released);
      }
};

//********************************************************************************************************************
// A cursor walks a sequence from the first position to the last, exactly once.  The state machine is
// NOT_STARTED -> IN_PROGRESS(0) -> ... -> IN_PROGRESS(size-1) -> EXHAUSTED, and EXHAUSTED is terminal.

enum class CURSOR : int {
   NOT_STARTED = 0,
   IN_PROGRESS,
   EXHAUSTED
};

template <class T> class LazyCursor {
   private:
      std::shared_ptr<const LazySequence<T>> seq;
      size_t pos = 0;
      CURSOR status = CURSOR::NOT_STARTED;

   public:
      LazyCursor() : status(CURSOR::EXHAUSTED) { }
      explicit LazyCursor(std::shared_ptr<const LazySequence<T>> Sequence) : seq(std::move(Sequence)) {
         if (not seq) status = CURSOR::EXHAUSTED;
      }

      inline CURSOR state() const { return status; }

      // Position of the element most recently returned by next().  Only meaningful while IN_PROGRESS.

      inline size_t position() const { return pos; }

      // Advance and return the element at the new position, or nullptr once the cursor is exhausted.

      typename LazySequence<T>::ELEMENT next() {
         switch (status) {
            case CURSOR::NOT_STARTED:
               pos = seq->start_index();
               break;
            case CURSOR::IN_PROGRESS:
               pos = seq->index_after(pos);
               break;
            case CURSOR::EXHAUSTED:
               return nullptr;
         }

         if (pos >= seq->end_index()) {
            status = CURSOR::EXHAUSTED;
            return nullptr;
         }

         status = CURSOR::IN_PROGRESS;
         return seq->get(pos);
      }
};

//********************************************************************************************************************
// Input iterator over a LazySequence.  Each begin() creates a fresh cursor.

template <class T> class LazyIterator {
   private:
      LazyCursor<T> cursor;
      typename LazySequence<T>::ELEMENT current;

   public:
      typedef std::input_iterator_tag iterator_category;
      typedef std::optional<T> value_type;
      typedef std::ptrdiff_t difference_type;
      typedef const value_type * pointer;
      typedef const value_type & reference;

      LazyIterator() = default;
      explicit LazyIterator(std::shared_ptr<const LazySequence<T>> Sequence) : cursor(std::move(Sequence)) {
         current = cursor.next();
      }

      reference operator*() const { return *current; }
      pointer operator->() const { return current.get(); }

      LazyIterator & operator++() {
         current = cursor.next();
         return *this;
      }

      LazyIterator operator++(int) {
         auto prev = *this;
         ++(*this);
         return prev;
      }

      // Iterators are only compared against the end of the sequence.

      bool operator==(const LazyIterator &Other) const {
         return (current IS nullptr) and (Other.current IS nullptr);
      }
};

} // namespace sift
