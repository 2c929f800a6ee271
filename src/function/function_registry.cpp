#include "tessera/function/function_registry.hpp"

#include "tessera/common/helper.hpp"
#include "tessera/common/string_util.hpp"
#include "tessera/logging/logger.hpp"
#include "tessera/symbol/function.hpp"

namespace tessera {

FunctionRegistry::FunctionRegistry(optional_ptr<Logger> logger) : logger(logger) {
}

void FunctionRegistry::Register(Signature signature, bind_return_type_t bind_return_type) {
	std::lock_guard<std::mutex> guard(lock);
	auto &overloads = functions[signature.GetName().Name()];
	for (auto &overload : overloads) {
		if (overload.signature == signature) {
			throw InternalException("Function overload %s is already registered", signature.ToString());
		}
	}
	if (logger) {
		TESSERA_LOG_TRACE(*logger, "resolution", "Registered function %s", signature.ToString());
	}
	overloads.emplace_back(std::move(signature), bind_return_type);
}

idx_t FunctionRegistry::OverloadCount() {
	std::lock_guard<std::mutex> guard(lock);
	idx_t count = 0;
	for (auto &entry : functions) {
		count += entry.second.size();
	}
	return count;
}

static idx_t NumericRank(const LogicalType &type) {
	switch (type.id()) {
	case LogicalTypeId::SMALLINT:
		return 1;
	case LogicalTypeId::INTEGER:
		return 2;
	case LogicalTypeId::BIGINT:
		return 3;
	case LogicalTypeId::REAL:
		return 4;
	case LogicalTypeId::DOUBLE:
		return 5;
	default:
		return 0;
	}
}

//! The cost of passing an argument of the source type to a parameter of the target type, false if it can not be passed
static bool ImplicitCastCost(const LogicalType &source, const LogicalType &target, idx_t &cost) {
	if (source == target) {
		cost = 0;
		return true;
	}
	if (source.id() == LogicalTypeId::UNDEFINED || target.id() == LogicalTypeId::ANY) {
		// unknown argument types (NULL literals, untyped parameters) and wildcards match anything
		cost = 1;
		return true;
	}
	if (source.IsArray() && target.IsArray()) {
		return ImplicitCastCost(source.ChildType(), target.ChildType(), cost);
	}
	auto source_rank = NumericRank(source);
	auto target_rank = NumericRank(target);
	if (source_rank > 0 && target_rank > source_rank) {
		// numeric widening
		cost = 10 + target_rank - source_rank;
		return true;
	}
	return false;
}

static bool BindFunctionCost(const Signature &signature, const vector<LogicalType> &arguments, idx_t &cost) {
	if (!signature.AcceptsArgumentCount(arguments.size())) {
		return false;
	}
	cost = 0;
	for (idx_t i = 0; i < arguments.size(); i++) {
		idx_t cast_cost;
		if (!ImplicitCastCost(arguments[i], signature.ArgumentType(i), cast_cost)) {
			return false;
		}
		cost += cast_cost;
	}
	return true;
}

static bool ContainsAny(const LogicalType &type) {
	return type.InnermostType().id() == LogicalTypeId::ANY;
}

static string CallToString(const FunctionName &name, const vector<LogicalType> &arguments) {
	return name.ToString(RenderStyle::QUALIFIED) + "(" + StringUtil::ToString(arguments, ", ") + ")";
}

const FunctionOverload &FunctionRegistry::ResolveOverload(const FunctionName &name,
                                                          const vector<LogicalType> &argument_types) {
	auto entry = functions.find(name.Name());
	if (entry == functions.end()) {
		vector<string> names;
		for (auto &function : functions) {
			names.push_back(function.first);
		}
		if (logger) {
			TESSERA_LOG_DEBUG(*logger, "resolution", "Unknown function %s", CallToString(name, argument_types));
		}
		throw ResolutionException("Unknown function: %s%s", name.ToString(RenderStyle::QUALIFIED),
		                          StringUtil::CandidatesErrorMessage(names, name.Name(), "Did you mean"));
	}
	auto &overloads = entry->second;
	optional_ptr<const FunctionOverload> best_function;
	idx_t lowest_cost = INVALID_INDEX;
	vector<string> candidates;
	for (auto &overload : overloads) {
		auto &overload_name = overload.signature.GetName();
		if (name.HasSchema() && overload_name.Schema() != name.Schema()) {
			continue;
		}
		idx_t cost;
		if (!BindFunctionCost(overload.signature, argument_types, cost)) {
			continue;
		}
		if (cost == lowest_cost) {
			candidates.push_back(overload.signature.ToString());
			continue;
		}
		if (cost > lowest_cost) {
			continue;
		}
		candidates.clear();
		candidates.push_back(overload.signature.ToString());
		lowest_cost = cost;
		best_function = &overload;
	}
	if (!best_function) {
		vector<string> signatures;
		for (auto &overload : overloads) {
			signatures.push_back("\t" + overload.signature.ToString());
		}
		if (logger) {
			TESSERA_LOG_DEBUG(*logger, "resolution", "No overload matches %s", CallToString(name, argument_types));
		}
		throw ResolutionException("No function matches the given name and argument types '%s'. You might need to "
		                          "add explicit type casts.\n\tCandidate functions:\n%s",
		                          CallToString(name, argument_types), StringUtil::Join(signatures, "\n"));
	}
	if (candidates.size() > 1) {
		if (logger) {
			TESSERA_LOG_DEBUG(*logger, "resolution", "Ambiguous call %s", CallToString(name, argument_types));
		}
		throw ResolutionException("Could not choose a best candidate function for the function call \"%s\". In "
		                          "order to select one, please add explicit type casts.\n\tCandidate functions:\n\t%s",
		                          CallToString(name, argument_types), StringUtil::Join(candidates, "\n\t"));
	}
	return *best_function;
}

const FunctionOverload &FunctionRegistry::FindOverload(const Signature &signature) {
	auto entry = functions.find(signature.GetName().Name());
	if (entry != functions.end()) {
		for (auto &overload : entry->second) {
			if (overload.signature == signature) {
				return overload;
			}
		}
	}
	throw ResolutionException("Function overload %s is not registered", signature.ToString());
}

Signature FunctionRegistry::Resolve(const FunctionName &name, const vector<LogicalType> &argument_types) {
	std::lock_guard<std::mutex> guard(lock);
	return ResolveOverload(name, argument_types).signature;
}

LogicalType FunctionRegistry::BindReturnType(const Signature &signature, const vector<LogicalType> &argument_types) {
	bind_return_type_t bind_return_type;
	{
		std::lock_guard<std::mutex> guard(lock);
		bind_return_type = FindOverload(signature).bind_return_type;
	}
	if (bind_return_type) {
		return bind_return_type(signature, argument_types);
	}
	if (ContainsAny(signature.ReturnType())) {
		throw InternalException("Function %s has a generic return type but no return type binding",
		                        signature.ToString());
	}
	return signature.ReturnType();
}

shared_ptr<Function> FunctionRegistry::Bind(const FunctionName &name, vector<shared_ptr<Symbol>> arguments,
                                            shared_ptr<Symbol> filter) {
	auto argument_types = Symbol::TypeView(arguments);
	auto signature = Resolve(name, argument_types);
	auto return_type = BindReturnType(signature, argument_types);
	if (filter && signature.GetKind() != FunctionKind::AGGREGATE) {
		throw InvalidInputException("FILTER is only supported for aggregate functions, %s is a %s function",
		                            signature.GetName().Name(), FunctionKindToString(signature.GetKind()));
	}
	// implicitly cast the arguments to the declared argument types
	for (idx_t i = 0; i < arguments.size(); i++) {
		auto &declared_type = signature.ArgumentType(i);
		if (ContainsAny(declared_type) || arguments[i]->ValueType() == declared_type) {
			continue;
		}
		arguments[i] = arguments[i]->CastTo(declared_type, {CastMode::IMPLICIT});
	}
	return make_shared_ptr<Function>(std::move(signature), std::move(arguments), std::move(return_type),
	                                 std::move(filter));
}

} // namespace tessera
