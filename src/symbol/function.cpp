#include "tessera/symbol/function.hpp"

#include "tessera/common/serializer.hpp"
#include "tessera/common/string_util.hpp"
#include "tessera/common/types/hash.hpp"
#include "tessera/function/builtin_functions.hpp"
#include "tessera/logging/logger.hpp"
#include "tessera/symbol/format/function_printer.hpp"
#include "tessera/symbol/symbol_visitor.hpp"

namespace tessera {

constexpr const SymbolType Function::TYPE;

Function::Function(Signature signature_p, vector<shared_ptr<Symbol>> arguments_p, LogicalType return_type_p,
                   shared_ptr<Symbol> filter_p)
    : Symbol(SymbolType::FUNCTION),
      info(FunctionInfo::Of(signature_p, Symbol::TypeView(arguments_p), return_type_p)),
      signature(make_uniq<Signature>(std::move(signature_p))), arguments(std::move(arguments_p)),
      return_type(std::move(return_type_p)), filter(std::move(filter_p)),
      syntax(ClassifySyntax(info.Ident().Name())) {
}

Function::Function(FunctionInfo info_p, unique_ptr<Signature> signature_p, vector<shared_ptr<Symbol>> arguments_p,
                   LogicalType return_type_p, shared_ptr<Symbol> filter_p)
    : Symbol(SymbolType::FUNCTION), info(std::move(info_p)), signature(std::move(signature_p)),
      arguments(std::move(arguments_p)), return_type(std::move(return_type_p)), filter(std::move(filter_p)),
      syntax(ClassifySyntax(info.Ident().Name())) {
}

//===--------------------------------------------------------------------===//
// Accessors
//===--------------------------------------------------------------------===//
const string &Function::Name() const {
	if (signature) {
		return signature->GetName().Name();
	}
	return info.Ident().Name();
}

bool Function::HasFeature(FunctionFeature feature) const {
	if (signature) {
		return signature->HasFeature(feature);
	}
	return info.HasFeature(feature);
}

bool Function::IsDeterministic() const {
	return HasFeature(FunctionFeature::DETERMINISTIC);
}

const FunctionName &Function::FullyQualifiedName() const {
	if (signature) {
		return signature->GetName();
	}
	return info.Ident().FqnName();
}

FunctionKind Function::Kind() const {
	if (signature) {
		return signature->GetKind();
	}
	return info.Kind();
}

void Function::Accept(SymbolVisitor &visitor) const {
	visitor.VisitFunction(*this);
}

FunctionSyntax Function::ClassifySyntax(const string &name) {
	if (name == BuiltinFunctions::MATCH) {
		return FunctionSyntax::MATCH_PREDICATE;
	}
	if (name == BuiltinFunctions::SUBSCRIPT || name == BuiltinFunctions::SUBSCRIPT_OBJ) {
		return FunctionSyntax::SUBSCRIPT;
	}
	if (name == BuiltinFunctions::SUBSCRIPT_RECORD) {
		return FunctionSyntax::SUBSCRIPT_RECORD;
	}
	if (name == BuiltinFunctions::CURRENT_USER) {
		return FunctionSyntax::CURRENT_USER;
	}
	if (name == BuiltinFunctions::SESSION_USER) {
		return FunctionSyntax::SESSION_USER;
	}
	if (name == BuiltinFunctions::CURRENT_SCHEMAS) {
		return FunctionSyntax::CURRENT_SCHEMAS;
	}
	if (name == BuiltinFunctions::CURRENT_SCHEMA) {
		return FunctionSyntax::CURRENT_SCHEMA;
	}
	if (name == BuiltinFunctions::IS_NULL) {
		return FunctionSyntax::IS_NULL;
	}
	if (name == BuiltinFunctions::NOT) {
		return FunctionSyntax::NOT;
	}
	if (name == BuiltinFunctions::COUNT) {
		return FunctionSyntax::COUNT;
	}
	if (name == BuiltinFunctions::CURRENT_TIMESTAMP) {
		return FunctionSyntax::CURRENT_TIMESTAMP;
	}
	if (StringUtil::StartsWith(name, BuiltinFunctions::ANY_OPERATOR_PREFIX)) {
		return FunctionSyntax::ANY_OPERATOR;
	}
	if (StringUtil::CIEquals(name, BuiltinFunctions::IMPLICIT_CAST) ||
	    StringUtil::CIEquals(name, BuiltinFunctions::EXPLICIT_CAST) ||
	    StringUtil::CIEquals(name, BuiltinFunctions::TRY_CAST)) {
		return FunctionSyntax::CAST;
	}
	if (StringUtil::StartsWith(name, BuiltinFunctions::OPERATOR_PREFIX)) {
		return FunctionSyntax::OPERATOR;
	}
	if (StringUtil::StartsWith(name, BuiltinFunctions::EXTRACT_PREFIX)) {
		return FunctionSyntax::EXTRACT;
	}
	if (name == BuiltinFunctions::ADD || name == BuiltinFunctions::SUBTRACT || name == BuiltinFunctions::MULTIPLY ||
	    name == BuiltinFunctions::DIVIDE || name == BuiltinFunctions::MOD || name == BuiltinFunctions::MODULUS) {
		return FunctionSyntax::ARITHMETIC;
	}
	return FunctionSyntax::GENERIC;
}

string Function::ToString(RenderStyle style) const {
	return FunctionPrinter::Print(*this, style);
}

//===--------------------------------------------------------------------===//
// Casting
//===--------------------------------------------------------------------===//
shared_ptr<Symbol> Function::CastTo(const LogicalType &target_type, CastModes modes) const {
	if (target_type.IsArray() && Name() == BuiltinFunctions::ARRAY) {
		return CastArrayElements(target_type, modes);
	}
	return Symbol::CastTo(target_type, modes);
}

shared_ptr<Symbol> Function::CastArrayElements(const LogicalType &target_type, CastModes modes) const {
	// the array constructor is never called with a FILTER clause, the rebuilt call does not carry one
	D_ASSERT(!filter);
	auto &element_type = target_type.ChildType();
	vector<shared_ptr<Symbol>> new_arguments;
	new_arguments.reserve(arguments.size());
	try {
		for (auto &argument : arguments) {
			new_arguments.push_back(argument->CastTo(element_type, modes));
		}
	} catch (ConversionException &) {
		throw ConversionException(return_type, target_type);
	}
	if (signature) {
		return make_shared_ptr<Function>(*signature, std::move(new_arguments), target_type);
	}
	FunctionInfo new_info(FunctionIdent(info.Ident().FqnName(), Symbol::TypeView(new_arguments)), target_type,
	                      info.Kind(), info.Features());
	return make_shared_ptr<Function>(std::move(new_info), unique_ptr<Signature>(), std::move(new_arguments),
	                                 target_type, shared_ptr<Symbol>());
}

//===--------------------------------------------------------------------===//
// Equality
//===--------------------------------------------------------------------===//
bool Function::Equals(const Symbol &other) const {
	if (other.type != SymbolType::FUNCTION) {
		return false;
	}
	auto &other_function = other.Cast<Function>();
	return Symbol::ListEquals(arguments, other_function.arguments) && info == other_function.info &&
	       Symbol::Equals(filter, other_function.filter);
}

hash_t Function::Hash() const {
	hash_t result = info.Hash();
	for (auto &argument : arguments) {
		result = CombineHash(result, argument->Hash());
	}
	if (filter) {
		result = CombineHash(result, filter->Hash());
	}
	return result;
}

//===--------------------------------------------------------------------===//
// Serialization
//===--------------------------------------------------------------------===//
void Function::SerializeProperties(Serializer &serializer) const {
	auto &version = serializer.GetVersion();
	info.Serialize(serializer);
	if (version.OnOrAfter(ProtocolVersion::FUNCTION_FILTER_SUPPORT)) {
		serializer.WriteOptional(filter);
	}
	serializer.WriteList(arguments);
	if (version.OnOrAfter(ProtocolVersion::FUNCTION_SIGNATURE_SUPPORT)) {
		serializer.Write<bool>(signature ? true : false);
		if (signature) {
			signature->Serialize(serializer);
			return_type.Serialize(serializer);
		}
	}
}

shared_ptr<Symbol> Function::Deserialize(Deserializer &source) {
	auto &version = source.GetVersion();
	auto info = FunctionInfo::Deserialize(source);
	shared_ptr<Symbol> filter;
	if (version.OnOrAfter(ProtocolVersion::FUNCTION_FILTER_SUPPORT)) {
		filter = source.ReadOptional<Symbol>();
	}
	auto arguments = source.ReadList<Symbol>();
	unique_ptr<Signature> signature;
	LogicalType return_type;
	if (version.OnOrAfter(ProtocolVersion::FUNCTION_SIGNATURE_SUPPORT) && source.ReadBool()) {
		signature = Signature::Deserialize(source);
		auto type_position = source.GetPosition();
		return_type = LogicalType::Deserialize(source);
		if (return_type.InnermostType().id() == LogicalTypeId::ANY) {
			throw SerializationException("Failed to deserialize: result type %s at position %d is not a concrete type",
			                             return_type.ToString(), type_position);
		}
	} else {
		return_type = info.ReturnType();
		auto logger = source.GetLogger();
		if (logger) {
			TESSERA_LOG_DEBUG(*logger, "wire", "Decoded call to %s without signature (protocol version %s)",
			                  info.Ident().ToString(), version.ToString());
		}
	}
	return make_shared_ptr<Function>(std::move(info), std::move(signature), std::move(arguments),
	                                 std::move(return_type), std::move(filter));
}

} // namespace tessera
