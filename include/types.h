#ifndef TYPES_H
#define TYPES_H

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// 字面量与常量折叠统一使用任意精度整数，u256 也不会截断
using BigInt = boost::multiprecision::cpp_int;

//===----------------------------------------------------------------------===//

enum class BaseType {
  Int,
  Bool,
  Address,
  String,
  Bytes,
  Map,
  Vector,
  Array,
  Tuple,
  Struct,
  Option,
  Result,
  Function,
  Void,
  Unknown
};

struct TypeInfo;
using TypeRef = std::shared_ptr<TypeInfo>;

struct TypeInfo {
  BaseType kind = BaseType::Unknown;
  std::string name; // 结构体名或整型名（u64 等）
  std::vector<TypeRef> parameters; // map 的 K/V、元组成员、Result 的 T/E、函数参数、结构体字段
  std::vector<std::string> fieldNames; // 结构体字段名，与 parameters 一一对应
  TypeRef elementType; // vec / 数组 / Option 的元素类型
  TypeRef returnType; // 函数返回类型
  bool isUnsigned = false;
  int bitWidth = 0;
  int64_t arrayLength = -1;

  bool equals(const TypeRef &other) const;

  std::string toString() const;

  bool isInteger() const { return kind == BaseType::Int; }

  bool isBool() const { return kind == BaseType::Bool; }

  bool isVoid() const { return kind == BaseType::Void; }

  bool isUnknown() const { return kind == BaseType::Unknown; }

  // 是否包含 Unknown（例如尚未定型的 None）
  bool containsUnknown() const;

  TypeRef fieldType(const std::string &field) const;
};

namespace TypeFactory {
  TypeRef getUnsigned(int bits);

  TypeRef getSigned(int bits);

  // "u64" / "i32" 之类的名字，不是整型名返回 nullptr
  TypeRef fromIntegerName(const std::string &name);

  TypeRef getBool();

  TypeRef getAddress();

  TypeRef getString();

  TypeRef getBytes();

  TypeRef getVoid();

  TypeRef getUnknown();

  TypeRef makeMap(const TypeRef &key, const TypeRef &value);

  TypeRef makeVector(const TypeRef &element);

  TypeRef makeArray(const TypeRef &element, int64_t length);

  TypeRef makeTuple(const std::vector<TypeRef> &elements);

  TypeRef makeStruct(const std::string &name, const std::vector<std::string> &fieldNames,
                     const std::vector<TypeRef> &fieldTypes);

  TypeRef makeOption(const TypeRef &element);

  TypeRef makeResult(const TypeRef &ok, const TypeRef &err);

  TypeRef makeFunction(const std::vector<TypeRef> &params, const TypeRef &ret);
}

BigInt integerMin(const TypeInfo &type);

BigInt integerMax(const TypeInfo &type);

bool integerFits(const BigInt &value, const TypeInfo &type);

#endif // TYPES_H
