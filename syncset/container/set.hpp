#pragma once

#include <functional>
#include <initializer_list>
#include <syncset/util/format.hpp>
#include <syncset/util/threading.hpp>
#include <syncset/util/util.hpp>
#include <unordered_set>
#include <utility>
#include <vector>

namespace syncset {

// A set of unique values guarded by a reader/writer lock.
//
// Pass unsafe = true to elide all locking; such a set must only ever be
// touched by one thread at a time.
//
// iterate(), with_read_lock() and with_write_lock() hold the lock while the
// callback runs. The callback must not call back into the same set, and a
// slow callback stalls every other user of the set.
//
// Cross-set operations lock this set first and then each operand in argument
// order, skipping operands that are this set. Running a.equal(b) on one thread
// and b.equal(a) on another can deadlock when writers are queued on both.
template <class Value, class Hash = std::hash<Value>,
          class Equal = std::equal_to<Value>>
class ConcurrentSet : noncopyable {
   public:
    typedef Value value_type;
    typedef std::unordered_set<Value, Hash, Equal> Storage;
    typedef typename Storage::const_iterator const_iterator;
    typedef std::vector<const ConcurrentSet *> Operands;

    class ReadView;
    class WriteView;

    explicit ConcurrentSet(bool unsafe = false) : m_mutex(not unsafe) {}
    // IntSet s(1) would otherwise convert to bool and build an unsafe set
    ConcurrentSet(int) = delete;
    ConcurrentSet(bool unsafe, const Hash &hash, const Equal &equal = Equal())
        : m_mutex(not unsafe), m_values(0, hash, equal) {}
    ConcurrentSet(std::initializer_list<Value> values, bool unsafe = false)
        : m_mutex(not unsafe), m_values(values) {}
    template <class Iterator>
    ConcurrentSet(Iterator begin, Iterator end, bool unsafe = false)
        : m_mutex(not unsafe), m_values(begin, end) {}

    // other is left empty; its mode carries over
    ConcurrentSet(ConcurrentSet &&other)
        : noncopyable(),
          m_mutex(other.m_mutex.enabled()),
          m_values(0, other.m_values.hash_function(),
                   other.m_values.key_eq()) {
        Mutex::UniqueLock lock(other.m_mutex);
        m_values.swap(other.m_values);
    }

    bool is_unsafe() const { return not m_mutex.enabled(); }
    Hash hash_function() const;
    Equal key_eq() const;

    // mutation
    template <class... Values>
    ConcurrentSet &add(Values &&... values);
    template <class Iterator>
    ConcurrentSet &add_all(Iterator begin, Iterator end);
    ConcurrentSet &remove(const Value &value);
    ConcurrentSet &clear();

    // queries
    bool contains(const Value &value) const;
    size_t size() const;
    bool empty() const;
    std::vector<Value> slice() const;
    template <class Visitor>
    const ConcurrentSet &iterate(Visitor visit) const;
    std::string join(const std::string &separator) const {
        return syncset::join(slice(), separator);
    }
    std::string str() const { return join(","); }

    // scoped access to the raw storage
    template <class Function>
    ConcurrentSet &with_write_lock(Function function);
    template <class Function>
    const ConcurrentSet &with_read_lock(Function function) const;

    // comparison
    bool equal(const ConcurrentSet &other) const;
    bool is_subset_of(const ConcurrentSet &other) const;
    bool operator==(const ConcurrentSet &other) const { return equal(other); }
    bool operator!=(const ConcurrentSet &other) const {
        return not equal(other);
    }
    bool operator<=(const ConcurrentSet &other) const {
        return is_subset_of(other);
    }

    // set algebra; results are new unsafe-mode sets with this set's functors.
    // set_diff and set_insn merge one pass per operand:
    //   set_diff(b, c) = (this - b) + (this - c)
    //   set_insn(b, c) = (this & b) + (this & c)
    // With no operands each returns an empty set.
    ConcurrentSet set_union(const Operands &others) const;
    ConcurrentSet set_diff(const Operands &others) const;
    ConcurrentSet set_insn(const Operands &others) const;
    template <class... Others>
    ConcurrentSet set_union(const Others &... others) const {
        return set_union(Operands{&others...});
    }
    template <class... Others>
    ConcurrentSet set_diff(const Others &... others) const {
        return set_diff(Operands{&others...});
    }
    template <class... Others>
    ConcurrentSet set_insn(const Others &... others) const {
        return set_insn(Operands{&others...});
    }
    // full - this, whether or not full is a superset of this
    ConcurrentSet complement(const ConcurrentSet &full) const;

   private:
    typedef OptionalSharedMutex Mutex;

    // shared lock on an operand, skipped when the operand is this set
    class OperandLock : noncopyable {
        const ConcurrentSet *const m_set;

       public:
        OperandLock(const ConcurrentSet &self, const ConcurrentSet &operand)
            : m_set(&operand == &self ? nullptr : &operand) {
            if (m_set) m_set->m_mutex.lock_shared();
        }
        ~OperandLock() {
            if (m_set) m_set->m_mutex.unlock_shared();
        }
    };

    bool _contains(const Value &value) const {
        return m_values.find(value) != m_values.end();
    }
    bool _contained_in(const ConcurrentSet &other) const;
    // assumes the lock is held
    ConcurrentSet _derived() const {
        return ConcurrentSet(true, m_values.hash_function(),
                             m_values.key_eq());
    }

    mutable Mutex m_mutex;
    Storage m_values;
};

//----------------------------------------------------------------------------
// Views

// Only reachable through the reference passed to a with_read_lock callback.
template <class Value, class Hash, class Equal>
class ConcurrentSet<Value, Hash, Equal>::ReadView : noncopyable {
    friend class ConcurrentSet<Value, Hash, Equal>;
    const Storage &m_values;

    explicit ReadView(const Storage &values) : m_values(values) {}

   public:
    bool contains(const Value &value) const {
        return m_values.find(value) != m_values.end();
    }
    size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }
    const_iterator begin() const { return m_values.begin(); }
    const_iterator end() const { return m_values.end(); }
};

// Only reachable through the reference passed to a with_write_lock callback.
template <class Value, class Hash, class Equal>
class ConcurrentSet<Value, Hash, Equal>::WriteView : noncopyable {
    friend class ConcurrentSet<Value, Hash, Equal>;
    Storage &m_values;

    explicit WriteView(Storage &values) : m_values(values) {}

   public:
    // returns true if value was not yet present
    bool insert(const Value &value) { return m_values.insert(value).second; }
    // returns true if value was present
    bool erase(const Value &value) { return m_values.erase(value) != 0; }
    void clear() { m_values.clear(); }

    bool contains(const Value &value) const {
        return m_values.find(value) != m_values.end();
    }
    size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }
    const_iterator begin() const { return m_values.begin(); }
    const_iterator end() const { return m_values.end(); }
};

template <class Value, class Hash, class Equal>
inline std::ostream &operator<<(std::ostream &o,
                                const ConcurrentSet<Value, Hash, Equal> &set) {
    return o << set.str();
}

//----------------------------------------------------------------------------
// Mutation

template <class Value, class Hash, class Equal>
template <class... Values>
inline ConcurrentSet<Value, Hash, Equal> &
ConcurrentSet<Value, Hash, Equal>::add(Values &&... values) {
    Mutex::UniqueLock lock(m_mutex);
    int expand[] = {0, (m_values.emplace(std::forward<Values>(values)), 0)...};
    (void)expand;
    return *this;
}

template <class Value, class Hash, class Equal>
template <class Iterator>
inline ConcurrentSet<Value, Hash, Equal> &
ConcurrentSet<Value, Hash, Equal>::add_all(Iterator begin, Iterator end) {
    Mutex::UniqueLock lock(m_mutex);
    m_values.insert(begin, end);
    return *this;
}

template <class Value, class Hash, class Equal>
inline ConcurrentSet<Value, Hash, Equal> &
ConcurrentSet<Value, Hash, Equal>::remove(const Value &value) {
    Mutex::UniqueLock lock(m_mutex);
    m_values.erase(value);
    return *this;
}

template <class Value, class Hash, class Equal>
inline ConcurrentSet<Value, Hash, Equal> &
ConcurrentSet<Value, Hash, Equal>::clear() {
    Mutex::UniqueLock lock(m_mutex);
    Storage(0, m_values.hash_function(), m_values.key_eq()).swap(m_values);
    return *this;
}

template <class Value, class Hash, class Equal>
template <class Function>
inline ConcurrentSet<Value, Hash, Equal> &
ConcurrentSet<Value, Hash, Equal>::with_write_lock(Function function) {
    Mutex::UniqueLock lock(m_mutex);
    WriteView view(m_values);
    function(view);
    return *this;
}

//----------------------------------------------------------------------------
// Queries

template <class Value, class Hash, class Equal>
inline bool ConcurrentSet<Value, Hash, Equal>::contains(
    const Value &value) const {
    Mutex::SharedLock lock(m_mutex);
    return _contains(value);
}

template <class Value, class Hash, class Equal>
inline size_t ConcurrentSet<Value, Hash, Equal>::size() const {
    Mutex::SharedLock lock(m_mutex);
    return m_values.size();
}

template <class Value, class Hash, class Equal>
inline bool ConcurrentSet<Value, Hash, Equal>::empty() const {
    Mutex::SharedLock lock(m_mutex);
    return m_values.empty();
}

template <class Value, class Hash, class Equal>
inline Hash ConcurrentSet<Value, Hash, Equal>::hash_function() const {
    Mutex::SharedLock lock(m_mutex);
    return m_values.hash_function();
}

template <class Value, class Hash, class Equal>
inline Equal ConcurrentSet<Value, Hash, Equal>::key_eq() const {
    Mutex::SharedLock lock(m_mutex);
    return m_values.key_eq();
}

template <class Value, class Hash, class Equal>
inline std::vector<Value> ConcurrentSet<Value, Hash, Equal>::slice() const {
    Mutex::SharedLock lock(m_mutex);
    return std::vector<Value>(m_values.begin(), m_values.end());
}

template <class Value, class Hash, class Equal>
template <class Visitor>
inline const ConcurrentSet<Value, Hash, Equal> &
ConcurrentSet<Value, Hash, Equal>::iterate(Visitor visit) const {
    Mutex::SharedLock lock(m_mutex);
    for (const auto &value : m_values) {
        if (not visit(value)) {
            break;
        }
    }
    return *this;
}

template <class Value, class Hash, class Equal>
template <class Function>
inline const ConcurrentSet<Value, Hash, Equal> &
ConcurrentSet<Value, Hash, Equal>::with_read_lock(Function function) const {
    Mutex::SharedLock lock(m_mutex);
    const ReadView view(m_values);
    function(view);
    return *this;
}

//----------------------------------------------------------------------------
// Comparison

// assumes both locks are held
template <class Value, class Hash, class Equal>
inline bool ConcurrentSet<Value, Hash, Equal>::_contained_in(
    const ConcurrentSet &other) const {
    for (const auto &value : m_values) {
        if (not other._contains(value)) {
            return false;
        }
    }
    return true;
}

template <class Value, class Hash, class Equal>
bool ConcurrentSet<Value, Hash, Equal>::equal(
    const ConcurrentSet &other) const {
    if (this == &other) {
        return true;
    }
    Mutex::SharedLock lock(m_mutex);
    Mutex::SharedLock other_lock(other.m_mutex);
    if (m_values.size() != other.m_values.size()) {
        return false;
    }
    return _contained_in(other);
}

template <class Value, class Hash, class Equal>
bool ConcurrentSet<Value, Hash, Equal>::is_subset_of(
    const ConcurrentSet &other) const {
    if (this == &other) {
        return true;
    }
    Mutex::SharedLock lock(m_mutex);
    Mutex::SharedLock other_lock(other.m_mutex);
    return _contained_in(other);
}

//----------------------------------------------------------------------------
// Set algebra

template <class Value, class Hash, class Equal>
ConcurrentSet<Value, Hash, Equal> ConcurrentSet<Value, Hash, Equal>::set_union(
    const Operands &others) const {
    Mutex::SharedLock lock(m_mutex);
    ConcurrentSet result = _derived();
    for (const ConcurrentSet *other : others) {
        SYNCSET_ASSERT(other, "null operand in set_union");
        OperandLock other_lock(*this, *other);
        result.m_values.insert(m_values.begin(), m_values.end());
        if (other != this) {
            result.m_values.insert(other->m_values.begin(),
                                   other->m_values.end());
        }
    }
    SYNCSET_DEBUG("set_union of " << others.size() << " operands has "
                                  << result.m_values.size() << " values");
    return result;
}

template <class Value, class Hash, class Equal>
ConcurrentSet<Value, Hash, Equal> ConcurrentSet<Value, Hash, Equal>::set_diff(
    const Operands &others) const {
    Mutex::SharedLock lock(m_mutex);
    ConcurrentSet result = _derived();
    for (const ConcurrentSet *other : others) {
        SYNCSET_ASSERT(other, "null operand in set_diff");
        if (other == this) {
            continue;
        }
        OperandLock other_lock(*this, *other);
        for (const auto &value : m_values) {
            if (not other->_contains(value)) {
                result.m_values.insert(value);
            }
        }
    }
    SYNCSET_DEBUG("set_diff of " << others.size() << " operands has "
                                 << result.m_values.size() << " values");
    return result;
}

template <class Value, class Hash, class Equal>
ConcurrentSet<Value, Hash, Equal> ConcurrentSet<Value, Hash, Equal>::set_insn(
    const Operands &others) const {
    Mutex::SharedLock lock(m_mutex);
    ConcurrentSet result = _derived();
    for (const ConcurrentSet *other : others) {
        SYNCSET_ASSERT(other, "null operand in set_insn");
        OperandLock other_lock(*this, *other);
        for (const auto &value : m_values) {
            if (other->_contains(value)) {
                result.m_values.insert(value);
            }
        }
    }
    SYNCSET_DEBUG("set_insn of " << others.size() << " operands has "
                                 << result.m_values.size() << " values");
    return result;
}

template <class Value, class Hash, class Equal>
ConcurrentSet<Value, Hash, Equal>
ConcurrentSet<Value, Hash, Equal>::complement(
    const ConcurrentSet &full) const {
    Mutex::SharedLock lock(m_mutex);
    OperandLock full_lock(*this, full);
    ConcurrentSet result = _derived();
    for (const auto &value : full.m_values) {
        if (not _contains(value)) {
            result.m_values.insert(value);
        }
    }
    SYNCSET_DEBUG("complement in " << full.m_values.size() << " values has "
                                   << result.m_values.size() << " values");
    return result;
}

}  // namespace syncset
