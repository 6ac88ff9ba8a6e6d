#pragma once

#include <bit>
#include <new>
#include <span>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cassert>
#include <limits>
#include <utility>
#include <iterator>
#include <optional>
#include <typeinfo>
#include <algorithm>
#include <concepts>
#include <stdexcept>
#include <functional>
#include <type_traits>
#include <unordered_map>

namespace polymap::meta {

  template <class T>
  struct identity {
    using type = T;
  };
  template <class T>
  using identity_t = typename identity<T>::type;

  // A storable type must be a move constructible object type, and if it is not nothrow
  // movable, it must also be copyable so the buffer can be relocated without losing values.
  // Assignment is not required: lambdas and types with const members are fine.
  template <class T>
  concept storable =
      std::is_object_v<T>
      && !std::is_const_v<T>
      && !std::is_volatile_v<T>
      && std::destructible<T>
      && std::move_constructible<T>
      && (std::is_nothrow_move_constructible_v<T> || std::copy_constructible<T>);

  // How a stored value gets carried over when the data buffer is reallocated.
  enum class relocation : uint8_t {
    bitwise,
    nothrow_move,
    copy
  };

  template <class T>
  constexpr relocation relocation_for() noexcept {
    if constexpr (std::is_trivially_copyable_v<T>) {
      return relocation::bitwise;
    } else if constexpr (std::is_nothrow_move_constructible_v<T>) {
      return relocation::nothrow_move;
    } else {
      return relocation::copy;
    }
  }

  // Everything the map needs to know about a stored type, with the types themselves erased.
  // One record exists per type, and its address is the identity the map compares against.
  struct type_record {
    size_t size_of;
    size_t align_of;
    relocation relocate_by;

    // Null when the type is trivially destructible.
    void (*destroy)(void*) noexcept;

    // Constructs a T at the first pointer from the T at the second.
    // Moves for relocation::nothrow_move, copies for relocation::copy, null for bitwise.
    void (*construct_from)(void*, void*);
  };

  template <storable T>
  void destroy_as(void* ptr) noexcept {
    static_cast<T*>(ptr)->~T();
  }

  template <storable T>
  void construct_as(void* dest, void* src) {
    if constexpr (std::is_nothrow_move_constructible_v<T>) {
      new(dest) T(std::move(*static_cast<T*>(src)));
    } else {
      new(dest) T(std::as_const(*static_cast<T*>(src)));
    }
  }

  template <storable T>
  constexpr type_record make_type_record() noexcept {
    // sizeof is never zero, so empty types still take a byte of their own
    // and two keys holding one can never share an address.
    void (*destroy)(void*) noexcept = nullptr;
    if constexpr (!std::is_trivially_destructible_v<T>) {
      destroy = &destroy_as<T>;
    }
    void (*construct_from)(void*, void*) = nullptr;
    if constexpr (relocation_for<T>() != relocation::bitwise) {
      construct_from = &construct_as<T>;
    }
    return type_record {sizeof(T), alignof(T), relocation_for<T>(), destroy, construct_from};
  }

  template <storable T>
  inline constexpr type_record type_record_for_v = make_type_record<T>();

  using type_id = type_record const*;

  template <storable T>
  constexpr type_id type_id_of() noexcept {
    return &type_record_for_v<T>;
  }

}

namespace polymap::storage {

  // The data buffer is allocated with aligned-new, which means it has to be paired with
  // aligned-delete. The alignment is a runtime property here since it grows with the
  // strictest type ever stored, so the deleter carries it.
  struct aligned_deleter {
    void operator ()(uint8_t* ptr) const noexcept {
      operator delete[](ptr, alignment);
    }

    std::align_val_t alignment;
  };

  // Rounds offset up to the next multiple of alignment, which must be a power of two.
  constexpr size_t align_up(size_t offset, size_t alignment) noexcept {
    assert(std::has_single_bit(alignment));
    return (offset + (alignment - 1)) & ~(alignment - 1);
  }

  inline bool aligned_for(void const* ptr, size_t alignment) noexcept {
    return !(reinterpret_cast<std::uintptr_t>(ptr) & (alignment - 1));
  }

  // One occupied region of the data buffer.
  struct field {
    size_t offset;
    size_t size;
    meta::type_id type;

    size_t end() const noexcept {
      return offset + size;
    }
  };

  struct placement {
    size_t offset;
    size_t position;
  };

  // Owns the data buffer and the field table describing what lives in it.
  //
  // The field table is kept sorted by offset, which lets the allocator find gaps left by
  // removed values with a single linear walk, and lets lookups by offset binary search.
  // Offsets never change once assigned. When the buffer itself has to move, every live
  // value is relocated to the same offset in the new allocation.
  struct field_storage {

    using size_type = size_t;
    using field_table = std::vector<field>;
    using data_storage = std::unique_ptr<uint8_t[], aligned_deleter>;

    static constexpr size_type base_alignment = alignof(std::max_align_t);
    static constexpr size_type min_capacity = 8;

    field_storage() noexcept :
      bytes(0),
      capacity_bytes(0),
      alignment(base_alignment),
      fields(),
      data(nullptr, aligned_deleter {std::align_val_t(base_alignment)})
    {}

    field_storage(size_type members, size_type capacity) : field_storage() {
      fields.reserve(members);
      if (capacity) {
        realloc(capacity, alignment);
      }
    }

    field_storage(field_storage const&) = delete;

    field_storage(field_storage&& other) noexcept :
      bytes(other.bytes),
      capacity_bytes(other.capacity_bytes),
      alignment(other.alignment),
      fields(std::move(other.fields)),
      data(std::move(other.data))
    {
      other.bytes = 0;
      other.capacity_bytes = 0;
      other.alignment = base_alignment;
      other.fields.clear();
    }

    ~field_storage() noexcept {
      clear();
    }

    field_storage& operator =(field_storage const&) = delete;

    field_storage& operator =(field_storage&& other) noexcept {
      if (this == &other) return *this;
      this->~field_storage();
      new(this) field_storage(std::move(other));
      return *this;
    }

    uint8_t* get_data() noexcept {
      return data.get();
    }

    uint8_t const* get_data() const noexcept {
      return data.get();
    }

    field_table::iterator find(size_type offset) noexcept {
      return std::lower_bound(fields.begin(), fields.end(), offset,
          [] (field const& f, size_type off) { return f.offset < off; });
    }

    field_table::const_iterator find(size_type offset) const noexcept {
      return std::lower_bound(fields.begin(), fields.end(), offset,
          [] (field const& f, size_type off) { return f.offset < off; });
    }

    // First-fit over the gaps between live fields, falling back on the end of the last one.
    // Returns the offset for the new value and the table position that keeps offsets sorted.
    placement find_placement(meta::type_record const& type) const noexcept {
      auto const size = type.size_of;
      auto const align = type.align_of;

      if (fields.empty() || size <= fields.front().offset) {
        return placement {0, 0};
      }

      for (size_type idx = 1; idx < fields.size(); ++idx) {
        auto const candidate = align_up(fields[idx - 1].end(), align);
        if (candidate + size <= fields[idx].offset) {
          return placement {candidate, idx};
        }
      }

      return placement {align_up(fields.back().end(), align), fields.size()};
    }

    // Makes sure the buffer is at least required bytes long and aligned for type_alignment.
    // Newly exposed bytes are zeroed.
    void prepare(size_type required, size_type type_alignment) {
      auto const new_alignment = std::max(alignment, type_alignment);
      if (required > capacity_bytes || new_alignment != alignment) {
        realloc(grown_capacity(required), new_alignment);
      }
      if (required > bytes) {
        memset(get_data() + bytes, 0, required - bytes);
        bytes = required;
      }
    }

    void reserve(size_type additional) {
      check_additional(additional);
      if (capacity_bytes - bytes < additional) {
        realloc(grown_capacity(bytes + additional), alignment);
      }
    }

    void reserve_exact(size_type additional) {
      check_additional(additional);
      if (capacity_bytes - bytes < additional) {
        realloc(bytes + additional, alignment);
      }
    }

    void reserve_fields(size_type additional) {
      auto const required = fields.size() + additional;
      if (required > fields.capacity()) {
        fields.reserve(std::max({required, fields.capacity() * 2, min_capacity}));
      }
    }

    void reserve_fields_exact(size_type additional) {
      fields.reserve(fields.size() + additional);
    }

    // Only trims the unused tail. Live fields are never compacted, so a gap left behind
    // by a removal in the middle of the buffer stays allocated.
    void shrink_to_fit() {
      if (capacity_bytes > bytes) {
        realloc(bytes, alignment);
      }
      fields.shrink_to_fit();
    }

    // Destroys every live value, highest offset first.
    void clear() noexcept {
      while (!fields.empty()) {
        auto const curr = fields.back();
        fields.pop_back();
        if (curr.type->destroy) {
          curr.type->destroy(get_data() + curr.offset);
        }
      }
      bytes = 0;
    }

    void swap(field_storage& other) noexcept {
      using std::swap;
      swap(bytes, other.bytes);
      swap(capacity_bytes, other.capacity_bytes);
      swap(alignment, other.alignment);
      swap(fields, other.fields);
      swap(data, other.data);
    }

    size_type grown_capacity(size_type required) const noexcept {
      if (required <= capacity_bytes) return capacity_bytes;
      return std::max({required, capacity_bytes * 2, min_capacity});
    }

    void check_additional(size_type additional) const {
      if (additional > std::numeric_limits<size_type>::max() - bytes) {
        throw std::length_error("polymap::map data buffer would exceed its maximum size");
      }
    }

    static data_storage allocate_block(size_type capacity, size_type align) {
      aligned_deleter deleter {std::align_val_t(align)};
      if (!capacity) {
        return data_storage {nullptr, deleter};
      }
      return data_storage {new(std::align_val_t(align)) uint8_t[capacity], deleter};
    }

    // Strong exception guarantee. If a copy throws, the old buffer is left untouched.
    void realloc(size_type new_capacity, size_type new_alignment) {
      assert(new_capacity >= bytes);
      auto newdata = allocate_block(new_capacity, new_alignment);
      if (bytes) {
        relocate_fields(newdata.get(), get_data());
      }
      data = std::move(newdata);
      capacity_bytes = new_capacity;
      alignment = new_alignment;
    }

    // Takes care of carrying every live value over to a new allocation, at the same offsets.
    void relocate_fields(uint8_t* dest, uint8_t* src) {
      // Trivially copyable values, and the gaps between fields, go across in one block.
      memcpy(dest, src, bytes);

      // Copies go first. Their constructors may throw, and since nothing in the source
      // has been moved from yet, unwinding only has to destroy the copies made so far.
      size_type copied = 0;
      try {
        for (auto const& f : fields) {
          if (f.type->relocate_by != meta::relocation::copy) continue;
          f.type->construct_from(dest + f.offset, src + f.offset);
          ++copied;
        }
      } catch (...) {
        for (auto const& f : fields) {
          if (!copied) break;
          if (f.type->relocate_by != meta::relocation::copy) continue;
          if (f.type->destroy) {
            f.type->destroy(dest + f.offset);
          }
          --copied;
        }
        throw;
      }

      for (auto const& f : fields) {
        if (f.type->relocate_by == meta::relocation::nothrow_move) {
          f.type->construct_from(dest + f.offset, src + f.offset);
        }
      }

      for (auto const& f : fields) {
        if (f.type->relocate_by != meta::relocation::bitwise && f.type->destroy) {
          f.type->destroy(src + f.offset);
        }
      }
    }

    size_type bytes;
    size_type capacity_bytes;
    size_type alignment;

    field_table fields;
    data_storage data;

  };

}

namespace polymap {

  // Thrown when a key is accessed with a type other than the one its value was stored as.
  class bad_field_type : public std::bad_cast {
    public:
      char const* what() const noexcept override {
        return "polymap::map was accessed with a type other than the one stored for the key";
      }
  };

  template <class Key, class Hash, class KeyEqual>
  class basic_map;

  template <class IndexIterator>
  class basic_key_iterator {

    public:

      using iterator_category = std::forward_iterator_tag;
      using value_type = std::remove_const_t<typename std::iterator_traits<IndexIterator>::value_type::first_type>;
      using difference_type = std::ptrdiff_t;
      using reference = value_type const&;
      using pointer = value_type const*;

      // Because default construction is useful.
      // Be careful!
      basic_key_iterator() noexcept : it() {}

      reference operator *() const noexcept {
        return it->first;
      }

      pointer operator ->() const noexcept {
        return &it->first;
      }

      basic_key_iterator& operator ++() noexcept {
        ++it;
        return *this;
      }

      basic_key_iterator operator ++(int) noexcept {
        auto tmp {*this};
        ++it;
        return tmp;
      }

    private:

      explicit basic_key_iterator(IndexIterator it) noexcept : it(it) {}

      template <class, class, class>
      friend class basic_map;

      IndexIterator it;

      friend bool operator ==(basic_key_iterator const& lhs, basic_key_iterator const& rhs) noexcept {
        return lhs.it == rhs.it;
      }

      friend bool operator !=(basic_key_iterator const& lhs, basic_key_iterator const& rhs) noexcept {
        return !(lhs == rhs);
      }

  };

  // A lightweight view over the keys of a map. Can be walked any number of times,
  // as long as the map isn't structurally modified in between.
  template <class Iterator>
  class basic_key_range {

    public:

      using iterator = Iterator;
      using size_type = size_t;

      basic_key_range(iterator first, iterator last, size_type count) noexcept :
        first(first),
        last(last),
        count(count)
      {}

      iterator begin() const noexcept {
        return first;
      }

      iterator end() const noexcept {
        return last;
      }

      size_type size() const noexcept {
        return count;
      }

      bool empty() const noexcept {
        return count == 0;
      }

    private:

      iterator first;
      iterator last;
      size_type count;

  };

  // A key-value map where every value may have a different type.
  //
  // Values are packed into one contiguous buffer rather than individually allocated.
  // Every access names the type it expects, and an access with any other type than the one
  // the value was stored as throws bad_field_type without touching the map.
  //
  // Pointers and references handed out by get, get_mut, and at are invalidated by any
  // insert of a new key, remove, clear, reserve, or shrink.
  template <class Key, class Hash = std::hash<Key>, class KeyEqual = std::equal_to<Key>>
  class basic_map {

    public:

      using key_type = Key;
      using hasher = Hash;
      using key_equal = KeyEqual;
      using size_type = size_t;
      using field_type = storage::field;

    private:

      using index_type = std::unordered_map<Key, size_type, Hash, KeyEqual>;

      static constexpr bool nothrow_index_movable =
        std::is_nothrow_move_constructible_v<index_type>;

    public:

      using key_iterator = basic_key_iterator<typename index_type::const_iterator>;
      using key_range = basic_key_range<key_iterator>;

      basic_map() = default;

      // Reserves space for the given number of fields and bytes of value data.
      basic_map(size_type members, size_type bytes) :
        index(),
        impl(members, bytes)
      {
        index.reserve(members);
      }

      basic_map(basic_map const&) = delete;

      basic_map(basic_map&& other) noexcept(nothrow_index_movable) :
        index(std::move(other.index)),
        impl(std::move(other.impl))
      {
        other.index.clear();
      }

      ~basic_map() = default;

      basic_map& operator =(basic_map const&) = delete;

      basic_map& operator =(basic_map&& other) noexcept(std::is_nothrow_move_assignable_v<index_type>) {
        if (&other == this) return *this;
        clear();
        index = std::move(other.index);
        impl = std::move(other.impl);
        other.index.clear();
        return *this;
      }

      // Stores value under key. If the key already holds a value of the same type, the old
      // value is swapped out and returned, otherwise a new field is placed in the buffer.
      template <meta::storable T>
      std::optional<T> insert(key_type key, T value) {
        auto const found = index.find(key);
        if (found != index.end()) {
          auto const& curr = field_for(found->second);
          check_type<T>(curr);
          return replace<T>(found, curr, std::move(value));
        }
        place<T>(std::move(key), std::move(value));
        return std::nullopt;
      }

      template <meta::storable T, class K>
      T const* get(K const& key) const {
        auto const found = index.find(key);
        if (found == index.end()) return nullptr;
        auto const& curr = field_for(found->second);
        check_type<T>(curr);
        return data_at<T>(curr.offset);
      }

      template <meta::storable T, class K>
      T* get_mut(K const& key) {
        return const_cast<T*>(std::as_const(*this).template get<T>(key));
      }

      template <meta::storable T, class K>
      T const& at(K const& key) const {
        auto const* ptr = get<T>(key);
        if (!ptr) missing_key();
        return *ptr;
      }

      template <meta::storable T, class K>
      T& at(K const& key) {
        auto* ptr = get_mut<T>(key);
        if (!ptr) missing_key();
        return *ptr;
      }

      // Moves the value for key out of the map. The storage it leaves behind is destroyed
      // and becomes a gap for future inserts, but the returned value itself is the caller's.
      template <meta::storable T, class K>
      std::optional<T> remove(K const& key) {
        auto const found = index.find(key);
        if (found == index.end()) return std::nullopt;

        auto const position = impl.find(found->second);
        assert(position != impl.fields.end() && position->offset == found->second);
        check_type<T>(*position);

        auto* const ptr = data_at<T>(position->offset);
        std::optional<T> value {std::move(*ptr)};
        ptr->~T();

        impl.fields.erase(position);
        index.erase(found);
        return value;
      }

      template <class K>
      bool contains_key(K const& key) const {
        return index.find(key) != index.end();
      }

      // Unlike the accessors, a type mismatch here is an answer rather than an error.
      template <class T, class K>
      bool contains_key_of(K const& key) const {
        if constexpr (meta::storable<T>) {
          auto const found = index.find(key);
          return found != index.end() && field_for(found->second).type == meta::type_id_of<T>();
        } else {
          return false;
        }
      }

      template <class K>
      std::optional<size_type> offset_of(K const& key) const {
        auto const found = index.find(key);
        if (found == index.end()) return std::nullopt;
        return found->second;
      }

      // The field table, sorted by offset.
      std::span<field_type const> fields() const noexcept {
        return {impl.fields.data(), impl.fields.size()};
      }

      key_range keys() const noexcept {
        return key_range {key_iterator {index.begin()}, key_iterator {index.end()}, index.size()};
      }

      size_type size() const noexcept {
        return impl.fields.size();
      }

      bool empty() const noexcept {
        return size() == 0;
      }

      // Destroys every stored value. The buffer keeps its capacity.
      void clear() noexcept {
        impl.clear();
        index.clear();
      }

      size_type data_size() const noexcept {
        return impl.bytes;
      }

      size_type data_capacity() const noexcept {
        return impl.capacity_bytes;
      }

      void reserve_data(size_type additional) {
        impl.reserve(additional);
      }

      void reserve_data_exact(size_type additional) {
        impl.reserve_exact(additional);
      }

      void reserve_fields(size_type additional) {
        impl.reserve_fields(additional);
        index.reserve(index.size() + additional);
      }

      void reserve_fields_exact(size_type additional) {
        impl.reserve_fields_exact(additional);
        index.reserve(index.size() + additional);
      }

      void shrink_data_to_fit() {
        impl.shrink_to_fit();
      }

      void swap(basic_map& other) noexcept(std::is_nothrow_swappable_v<index_type>) {
        using std::swap;
        swap(index, other.index);
        impl.swap(other.impl);
      }

      friend void swap(basic_map& lhs, basic_map& rhs) noexcept(noexcept(lhs.swap(rhs))) {
        lhs.swap(rhs);
      }

    private:

      template <meta::storable T>
      void place(key_type&& key, T&& value) {
        constexpr meta::type_id type = meta::type_id_of<T>();
        auto const [offset, position] = impl.find_placement(*type);

        // Everything that can throw happens before the field is recorded.
        impl.reserve_fields(1);
        auto const restore_bytes = impl.bytes;
        impl.prepare(offset + type->size_of, type->align_of);

        // Both the key node and the value can throw on the way in.
        typename index_type::iterator slot;
        bool indexed = false;
        try {
          auto const emplaced = index.emplace(std::move(key), offset);
          assert(emplaced.second);
          slot = emplaced.first;
          indexed = true;

          auto* const dest = impl.get_data() + offset;
          assert(storage::aligned_for(dest, type->align_of));
          new(dest) T(std::move(value));
        } catch (...) {
          if (indexed) index.erase(slot);
          impl.bytes = restore_bytes;
          throw;
        }

        impl.fields.insert(impl.fields.begin() + position, field_type {offset, type->size_of, type});
      }

      // Swaps a new value into an occupied field of the same type. Types without move
      // assignment are rebuilt in place: the old value is moved out, then the new one is
      // constructed over the destroyed slot.
      template <meta::storable T>
      T replace(typename index_type::iterator found, field_type const& curr, T&& value) {
        auto* const slot = data_at<T>(curr.offset);
        if constexpr (std::is_move_assignable_v<T>) {
          return std::exchange(*slot, std::move(value));
        } else {
          T old(std::move(*slot));
          slot->~T();
          if constexpr (std::is_nothrow_move_constructible_v<T>) {
            new(slot) T(std::move(value));
          } else {
            try {
              new(slot) T(std::move(value));
            } catch (...) {
              restore(found, slot, std::move(old));
              throw;
            }
          }
          return old;
        }
      }

      // Puts old back after a failed replace. If even that fails, the slot holds nothing
      // and the entry is dropped so the map never destroys a dead value.
      template <meta::storable T>
      void restore(typename index_type::iterator found, T* slot, T&& old) noexcept {
        try {
          new(slot) T(std::move(old));
        } catch (...) {
          auto const position = impl.find(found->second);
          assert(position != impl.fields.end() && position->offset == found->second);
          impl.fields.erase(position);
          index.erase(found);
        }
      }

      template <meta::storable T>
      static void check_type(field_type const& curr) {
        if (curr.type != meta::type_id_of<T>()) {
          throw bad_field_type();
        }
      }

      field_type const& field_for(size_type offset) const noexcept {
        auto const found = impl.find(offset);
        assert(found != impl.fields.end() && found->offset == offset);
        return *found;
      }

      template <class T>
      T* data_at(size_type offset) noexcept {
        return std::launder(reinterpret_cast<T*>(impl.get_data() + offset));
      }

      template <class T>
      T const* data_at(size_type offset) const noexcept {
        return std::launder(reinterpret_cast<T const*>(impl.get_data() + offset));
      }

      [[noreturn]] void missing_key() const {
        std::string msg = "polymap::map has no value for the requested key. ";
        msg += "Map size was: " + std::to_string(size());
        throw std::out_of_range(msg);
      }

      index_type index;
      storage::field_storage impl;

  };

  template <class Key>
  using map = basic_map<Key>;

}
