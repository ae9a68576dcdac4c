#ifndef HEADER_GUARD_8f31552302152801f2c0db392c65d674
#define HEADER_GUARD_8f31552302152801f2c0db392c65d674

#include "./fwd.hpp"

#include <deque>
#include <list>
#include <map>
#include <set>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>

namespace argbind {

/**
 * \defgroup Binding Value binding
 * \brief Where parsed values are stored.
 * \details Every option and positional parameter writes its value through a \ref Binding.  The value
 * type determines how values are accumulated: single values are replaced, sequence containers
 * (\c std::vector, \c std::list, \c std::deque, \c std::set, \c std::unordered_set) are appended to, and
 * associative containers (\c std::map, \c std::unordered_map) receive \c KEY=VALUE pairs.
 * @{
 **/

enum class Shape {
  scalar,
  sequence,
  mapping,
};

/**
 * \brief Type-erased description of the type bound to an argument.
 **/
struct ValueType {
  std::type_index type = typeid(void);
  Shape shape = Shape::scalar;

  /**
   * \brief Element type of a sequence, key and value types of a mapping, or the type itself.
   **/
  vector<std::type_index> auxiliary_types;

  /**
   * \brief Returns a value-initialized instance (an empty container for sequences and mappings).
   **/
  any (*make_default)() = nullptr;

  /**
   * \brief Appends \p element to the sequence held in \p container.
   **/
  void (*append)(any &container, any const &element) = nullptr;

  /**
   * \brief Inserts \p key and \p value into the mapping held in \p container.
   **/
  void (*put)(any &container, any const &key, any const &value) = nullptr;

  /**
   * \brief Number of elements of a sequence or mapping.
   **/
  size_t (*size)(any const &container) = nullptr;

  bool is_multi_value() const { return shape != Shape::scalar; }
  bool is_boolean() const { return auxiliary_types.size() == 1 && auxiliary_types[0] == typeid(bool); }
};

namespace detail {

template <class T>
struct scalar_value_traits {
  static constexpr Shape shape = Shape::scalar;
  static vector<std::type_index> auxiliary_types() { return { typeid(T) }; }
  static void append(any &, any const &) {}
  static void put(any &, any const &, any const &) {}
  static size_t size(any const &) { return 1; }
};

template <class Container, class Element>
struct sequence_value_traits {
  static constexpr Shape shape = Shape::sequence;
  static vector<std::type_index> auxiliary_types() { return { typeid(Element) }; }
  static void append(any &container, any const &element) {
    auto &c = any_cast<Container &>(container);
    c.insert(c.end(), any_cast<Element const &>(element));
  }
  static void put(any &, any const &, any const &) {}
  static size_t size(any const &container) { return any_cast<Container const &>(container).size(); }
};

template <class Container, class Key, class Value>
struct mapping_value_traits {
  static constexpr Shape shape = Shape::mapping;
  static vector<std::type_index> auxiliary_types() { return { typeid(Key), typeid(Value) }; }
  static void append(any &, any const &) {}
  static void put(any &container, any const &key, any const &value) {
    auto &c = any_cast<Container &>(container);
    c[any_cast<Key const &>(key)] = any_cast<Value const &>(value);
  }
  static size_t size(any const &container) { return any_cast<Container const &>(container).size(); }
};

template <class T>
struct value_traits : scalar_value_traits<T> {};

template <class T, class A>
struct value_traits<std::vector<T, A>> : sequence_value_traits<std::vector<T, A>, T> {};

template <class T, class A>
struct value_traits<std::list<T, A>> : sequence_value_traits<std::list<T, A>, T> {};

template <class T, class A>
struct value_traits<std::deque<T, A>> : sequence_value_traits<std::deque<T, A>, T> {};

template <class T, class C, class A>
struct value_traits<std::set<T, C, A>> : sequence_value_traits<std::set<T, C, A>, T> {};

template <class T, class H, class E, class A>
struct value_traits<std::unordered_set<T, H, E, A>> : sequence_value_traits<std::unordered_set<T, H, E, A>, T> {};

template <class K, class V, class C, class A>
struct value_traits<std::map<K, V, C, A>> : mapping_value_traits<std::map<K, V, C, A>, K, V> {};

template <class K, class V, class H, class E, class A>
struct value_traits<std::unordered_map<K, V, H, E, A>> : mapping_value_traits<std::unordered_map<K, V, H, E, A>, K, V> {};

template <class T>
any make_default_value() {
  return any(T());
}

} // namespace detail

/**
 * \brief Returns the \ref ValueType describing \p T.
 **/
template <class T>
ValueType value_type_of() {
  using traits = detail::value_traits<T>;
  ValueType result;
  result.type = typeid(T);
  result.shape = traits::shape;
  result.auxiliary_types = traits::auxiliary_types();
  result.make_default = &detail::make_default_value<T>;
  result.append = &traits::append;
  result.put = &traits::put;
  result.size = &traits::size;
  return result;
}

/**
 * \brief Abstracts where the value of an argument is stored.
 **/
class Binding {
public:
  virtual ~Binding() = default;

  /**
   * \brief Returns the current value.  May be empty if no value was ever stored.
   **/
  virtual any get() const = 0;

  /**
   * \brief Stores \p value.  The held type must be the type the argument was declared with.
   **/
  virtual void set(any value) = 0;
};

/**
 * \brief Stores the value inside the binding itself.
 **/
class ObjectBinding : public Binding {
  any value_;
public:
  ObjectBinding() = default;
  explicit ObjectBinding(any value) : value_(std::move(value)) {}
  any get() const override { return value_; }
  void set(any value) override { value_ = std::move(value); }
};

/**
 * \brief Stores the value in a variable owned by the caller, such as a member of a plain struct.
 *
 * The variable must outlive every parse using the binding.
 **/
template <class T>
class ReferenceBinding : public Binding {
  T *target_;
public:
  explicit ReferenceBinding(T &target) : target_(&target) {}
  any get() const override { return any(*target_); }
  void set(any value) override { *target_ = any_cast<T const &>(value); }
};

/**
 * \brief Delegates to a getter and a setter function.
 **/
class FunctionBinding : public Binding {
  std::function<any ()> getter_;
  std::function<void (any)> setter_;
public:
  FunctionBinding(std::function<any ()> getter, std::function<void (any)> setter)
    : getter_(std::move(getter)), setter_(std::move(setter))
  {}
  any get() const override { return getter_(); }
  void set(any value) override { setter_(std::move(value)); }
};

/** @} */

} // namespace argbind

#endif /* HEADER GUARD */
