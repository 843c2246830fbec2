#include "types.h"

#include <sstream>

//===----------------------------------------------------------------------===//
// TypeInfo helpers
//===----------------------------------------------------------------------===//

bool TypeInfo::equals(const TypeRef &other) const {
  if (!other) {
    return false;
  }
  // Unknown 只出现在已报错的表达式上，视为通配以免连锁报错
  if (kind == BaseType::Unknown || other->kind == BaseType::Unknown) {
    return true;
  }
  if (kind != other->kind) {
    return false;
  }

  switch (kind) {
    case BaseType::Int:
      return isUnsigned == other->isUnsigned && bitWidth == other->bitWidth;
    case BaseType::Vector:
    case BaseType::Option:
      return elementType->equals(other->elementType);
    case BaseType::Array:
      return arrayLength == other->arrayLength && elementType->equals(other->elementType);
    case BaseType::Struct:
      // 名字相同且字段签名一致
      if (name != other->name || fieldNames != other->fieldNames) {
        return false;
      }
      [[fallthrough]];
    case BaseType::Map:
    case BaseType::Tuple:
    case BaseType::Result:
      if (parameters.size() != other->parameters.size()) {
        return false;
      }
      for (size_t i = 0; i < parameters.size(); ++i) {
        if (!parameters[i]->equals(other->parameters[i])) {
          return false;
        }
      }
      return true;
    case BaseType::Function:
      if (parameters.size() != other->parameters.size()) {
        return false;
      }
      for (size_t i = 0; i < parameters.size(); ++i) {
        if (!parameters[i]->equals(other->parameters[i])) {
          return false;
        }
      }
      return returnType->equals(other->returnType);
    default:
      return true;
  }
}

std::string TypeInfo::toString() const {
  switch (kind) {
    case BaseType::Int:
      return name;
    case BaseType::Bool:
      return "bool";
    case BaseType::Address:
      return "address";
    case BaseType::String:
      return "string";
    case BaseType::Bytes:
      return "bytes";
    case BaseType::Void:
      return "void";
    case BaseType::Unknown:
      return "unknown";
    case BaseType::Struct:
      return name;
    case BaseType::Map:
      return "map<" + parameters[0]->toString() + ", " + parameters[1]->toString() + ">";
    case BaseType::Vector:
      return "vec<" + elementType->toString() + ">";
    case BaseType::Array:
      return "[" + elementType->toString() + "; " + std::to_string(arrayLength) + "]";
    case BaseType::Option:
      return "Option<" + elementType->toString() + ">";
    case BaseType::Result:
      return "Result<" + parameters[0]->toString() + ", " + parameters[1]->toString() + ">";
    case BaseType::Tuple:
    case BaseType::Function: {
      std::ostringstream oss;
      oss << (kind == BaseType::Function ? "fn(" : "(");
      for (size_t i = 0; i < parameters.size(); ++i) {
        if (i > 0) {
          oss << ", ";
        }
        oss << parameters[i]->toString();
      }
      oss << ")";
      if (kind == BaseType::Function && returnType && !returnType->isVoid()) {
        oss << " -> " << returnType->toString();
      }
      return oss.str();
    }
  }
  return "unknown";
}

bool TypeInfo::containsUnknown() const {
  if (kind == BaseType::Unknown) {
    return true;
  }
  if (elementType && elementType->containsUnknown()) {
    return true;
  }
  for (const auto &p: parameters) {
    if (p && p->containsUnknown()) {
      return true;
    }
  }
  return returnType && returnType->containsUnknown();
}

TypeRef TypeInfo::fieldType(const std::string &field) const {
  for (size_t i = 0; i < fieldNames.size(); ++i) {
    if (fieldNames[i] == field) {
      return parameters[i];
    }
  }
  return nullptr;
}

//===----------------------------------------------------------------------===//
// TypeFactory
//===----------------------------------------------------------------------===//

namespace {
  TypeRef makeSimple(BaseType kind) {
    auto t = std::make_shared<TypeInfo>();
    t->kind = kind;
    return t;
  }

  TypeRef makeInt(bool isUnsigned, int bits) {
    auto t = makeSimple(BaseType::Int);
    t->isUnsigned = isUnsigned;
    t->bitWidth = bits;
    t->name = (isUnsigned ? "u" : "i") + std::to_string(bits);
    return t;
  }
} // namespace

TypeRef TypeFactory::getUnsigned(int bits) {
  return makeInt(true, bits);
}

TypeRef TypeFactory::getSigned(int bits) {
  return makeInt(false, bits);
}

TypeRef TypeFactory::fromIntegerName(const std::string &name) {
  static const char *unsignedNames[] = {"u8", "u16", "u32", "u64", "u128", "u256"};
  static const char *signedNames[] = {"i8", "i16", "i32", "i64", "i128"};
  for (const char *n: unsignedNames) {
    if (name == n) {
      return getUnsigned(std::stoi(name.substr(1)));
    }
  }
  for (const char *n: signedNames) {
    if (name == n) {
      return getSigned(std::stoi(name.substr(1)));
    }
  }
  return nullptr;
}

TypeRef TypeFactory::getBool() {
  return makeSimple(BaseType::Bool);
}

TypeRef TypeFactory::getAddress() {
  return makeSimple(BaseType::Address);
}

TypeRef TypeFactory::getString() {
  return makeSimple(BaseType::String);
}

TypeRef TypeFactory::getBytes() {
  return makeSimple(BaseType::Bytes);
}

TypeRef TypeFactory::getVoid() {
  return makeSimple(BaseType::Void);
}

TypeRef TypeFactory::getUnknown() {
  return makeSimple(BaseType::Unknown);
}

TypeRef TypeFactory::makeMap(const TypeRef &key, const TypeRef &value) {
  auto t = makeSimple(BaseType::Map);
  t->parameters = {key, value};
  return t;
}

TypeRef TypeFactory::makeVector(const TypeRef &element) {
  auto t = makeSimple(BaseType::Vector);
  t->elementType = element;
  return t;
}

TypeRef TypeFactory::makeArray(const TypeRef &element, int64_t length) {
  auto t = makeSimple(BaseType::Array);
  t->elementType = element;
  t->arrayLength = length;
  return t;
}

TypeRef TypeFactory::makeTuple(const std::vector<TypeRef> &elements) {
  auto t = makeSimple(BaseType::Tuple);
  t->parameters = elements;
  return t;
}

TypeRef TypeFactory::makeStruct(const std::string &name, const std::vector<std::string> &fieldNames,
                                const std::vector<TypeRef> &fieldTypes) {
  auto t = makeSimple(BaseType::Struct);
  t->name = name;
  t->fieldNames = fieldNames;
  t->parameters = fieldTypes;
  return t;
}

TypeRef TypeFactory::makeOption(const TypeRef &element) {
  auto t = makeSimple(BaseType::Option);
  t->elementType = element;
  return t;
}

TypeRef TypeFactory::makeResult(const TypeRef &ok, const TypeRef &err) {
  auto t = makeSimple(BaseType::Result);
  t->parameters = {ok, err};
  return t;
}

TypeRef TypeFactory::makeFunction(const std::vector<TypeRef> &params, const TypeRef &ret) {
  auto t = makeSimple(BaseType::Function);
  t->parameters = params;
  t->returnType = ret;
  return t;
}

//===----------------------------------------------------------------------===//
// Integer ranges
//===----------------------------------------------------------------------===//

BigInt integerMin(const TypeInfo &type) {
  if (type.isUnsigned) {
    return 0;
  }
  BigInt one = 1;
  return -(one << (type.bitWidth - 1));
}

BigInt integerMax(const TypeInfo &type) {
  BigInt one = 1;
  if (type.isUnsigned) {
    return (one << type.bitWidth) - 1;
  }
  return (one << (type.bitWidth - 1)) - 1;
}

bool integerFits(const BigInt &value, const TypeInfo &type) {
  if (type.kind != BaseType::Int) {
    return false;
  }
  return value >= integerMin(type) && value <= integerMax(type);
}
