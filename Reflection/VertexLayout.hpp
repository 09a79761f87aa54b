//
//  VertexLayout.hpp
//  Trichrome
//
//  Created by the Trichrome authors on 16/10/2026.
//  Copyright © 2026 the Trichrome authors. All rights reserved.
//

#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace Reflection {

/*!
	Vertex records declare their fields in order, each tagged with the shader attribute location
	it supplies. E.g.

		struct ColouredVertex {
			BeginVertexFields(ColouredVertex);
			VertexField(0, Vertex::Vec3f, position);
			VertexField(1, Vertex::PackedRGBA, colour);
		};

	VertexLayout<ColouredVertex> then derives the stride and every field's offset from declaration order,
	and can replay the field list into an attribute target.

	Fields are laid out back to back, so a record mixing field widths, e.g. a Vec3f followed by an I8,
	must be declared packed for its size to equal the sum of its fields:

		#pragma pack(push, 1)
		struct FlaggedVertex {
			BeginVertexFields(FlaggedVertex);
			VertexField(0, Vertex::Vec3f, position);
			VertexField(1, Vertex::I8, flag);
		};
		#pragma pack(pop)

	Faults are reported at compile time, naming the field:

		*	a location that is absent, either as VertexField(, Type, name) or VertexField(Type, name);
		*	a location that is not a non-negative decimal integer literal;
		*	a field type that cannot describe itself as a vertex attribute.

	VertexLayout additionally rejects records that are not flat, standard-layout aggregates of
	declared fields, records with padding and records with members not declared via VertexField.
*/
#define BeginVertexFields(Record)	\
	using VertexRecord = Record;	\
	static constexpr int vertex_field_base_ = __COUNTER__

#define VertexField(...)	\
	TrichromeSelectVertexField(__VA_ARGS__, TrichromeVertexField3, TrichromeVertexField2, TrichromeVertexField1)(__VA_ARGS__)

#define TrichromeSelectVertexField(_1, _2, _3, Name, ...) Name

#define TrichromeVertexField1(Name)	\
	static_assert(false, "Vertex field '" #Name "' must be declared as VertexField(location, Type, name)")

#define TrichromeVertexField2(FieldType, Name) TrichromeVertexField3(, FieldType, Name)

#define TrichromeVertexField3(Location, FieldType, Name)	\
	FieldType Name;	\
	static constexpr auto vertex_field(::Reflection::VertexFieldIndex<__COUNTER__ - vertex_field_base_ - 1>) {	\
		static_assert(::Reflection::VertexFieldType<FieldType>, "Vertex field '" #Name "' is not of a vertex field type");	\
		constexpr auto location = ::Reflection::parse_location(#Location);	\
		static_assert(location.present, "Vertex field '" #Name "' has no attribute location");	\
		static_assert(location.valid, "Vertex field '" #Name "' declares attribute location '" #Location "', which is not a non-negative integer literal");	\
		return ::Reflection::VertexFieldDeclaration<FieldType>{#Name, location.value, offsetof(VertexRecord, Name)};	\
	}

/// Anything that knows its own shape as a GPU attribute and can describe itself to a target.
template <typename FieldT>
concept VertexFieldType = requires {
	{ FieldT::components } -> std::convertible_to<int>;
	{ FieldT::element_type } -> std::convertible_to<uint32_t>;
	{ FieldT::normalised } -> std::convertible_to<bool>;
	{ FieldT::integral } -> std::convertible_to<bool>;
} && std::is_trivially_copyable_v<FieldT>;

template <int index> struct VertexFieldIndex {};

template <typename FieldT>
struct VertexFieldDeclaration {
	using Type = FieldT;

	const char *name;
	uint32_t location;
	size_t offset;		// As actually laid out by the compiler; checked against the derived offset.
};

struct Location {
	bool present = false;
	bool valid = false;
	uint32_t value = 0;
};

/// Parses the stringised form of a location token; only plain decimal literals are accepted.
constexpr Location parse_location(const char *text) {
	Location location;
	if(!*text) return location;
	location.present = true;

	uint64_t value = 0;
	while(*text) {
		if(*text < '0' || *text > '9') return location;
		value = value * 10 + uint64_t(*text - '0');
		if(value > 0x7fff'ffff) return location;
		++text;
	}

	location.valid = true;
	location.value = uint32_t(value);
	return location;
}

/// Everything derived about a single field.
struct FieldLayout {
	const char *name;
	uint32_t location;
	size_t offset;
	size_t size;

	int components;
	uint32_t element_type;
	bool normalised;
	bool integral;
};

template <typename RecordT, int index = 0>
consteval int count_vertex_fields() {
	if constexpr (requires { RecordT::vertex_field(VertexFieldIndex<index>{}); }) {
		return count_vertex_fields<RecordT, index + 1>();
	} else {
		return index;
	}
}

template <typename RecordT, int index>
using vertex_field_t = typename decltype(RecordT::vertex_field(VertexFieldIndex<index>{}))::Type;

template <typename RecordT, int... indices>
consteval size_t sum_field_sizes(std::integer_sequence<int, indices...>) {
	return (size_t(0) + ... + sizeof(vertex_field_t<RecordT, indices>));
}

/// The offset of field @c index is the sum of the sizes of all fields declared before it.
template <typename RecordT, int index>
consteval FieldLayout field_layout() {
	constexpr auto declaration = RecordT::vertex_field(VertexFieldIndex<index>{});
	using FieldT = vertex_field_t<RecordT, index>;
	return FieldLayout{
		declaration.name,
		declaration.location,
		sum_field_sizes<RecordT>(std::make_integer_sequence<int, index>{}),
		sizeof(FieldT),
		int(FieldT::components),
		uint32_t(FieldT::element_type),
		bool(FieldT::normalised),
		bool(FieldT::integral),
	};
}

template <typename RecordT, int... indices>
consteval std::array<FieldLayout, sizeof...(indices)> field_layouts(std::integer_sequence<int, indices...>) {
	return {field_layout<RecordT, indices>()...};
}

template <typename RecordT, int... indices>
consteval bool offsets_agree(std::integer_sequence<int, indices...>) {
	return ((RecordT::vertex_field(VertexFieldIndex<indices>{}).offset == field_layout<RecordT, indices>().offset) && ...);
}

template <typename RecordT>
struct VertexLayout {
	static_assert(
		std::is_class_v<RecordT> && std::is_standard_layout_v<RecordT> && !std::is_polymorphic_v<RecordT>,
		"Only flat field-based records are supported");
	static_assert(std::is_trivially_copyable_v<RecordT>, "Vertex records must be trivially copyable");

	static constexpr int field_count = count_vertex_fields<RecordT>();
	static_assert(field_count > 0, "Vertex records must declare at least one field via VertexField");

	template <int index> using FieldType = vertex_field_t<RecordT, index>;

	/// The distance between consecutive records, being the sum of all field sizes.
	static constexpr size_t stride = sum_field_sizes<RecordT>(std::make_integer_sequence<int, field_count>{});

	/// All fields in declaration order, with derived offsets.
	static constexpr std::array<FieldLayout, size_t(field_count)> fields =
		field_layouts<RecordT>(std::make_integer_sequence<int, field_count>{});

	/// The stride as the compiler would round it up were the record not packed.
	static constexpr size_t aligned_stride = (stride + alignof(RecordT) - 1) / alignof(RecordT) * alignof(RecordT);

	static_assert(
		stride == sizeof(RecordT) || sizeof(RecordT) != aligned_stride,
		"Vertex record contains padding; declare it packed, e.g. between #pragma pack(push, 1) and #pragma pack(pop)");
	static_assert(
		stride == sizeof(RecordT) || sizeof(RecordT) == aligned_stride,
		"Vertex record size differs from the sum of its declared fields; all members must be declared via VertexField");
	static_assert(
		offsets_agree<RecordT>(std::make_integer_sequence<int, field_count>{}),
		"Vertex record fields are not laid out consecutively in declaration order");

	/*!
		Has each field describe itself to @c target, in declaration order, with its declared location,
		its derived offset and the record stride.
	*/
	template <typename TargetT>
	static void apply(TargetT &target) {
		[&]<int... indices>(std::integer_sequence<int, indices...>) {
			(FieldType<indices>::describe(target, int(stride), fields[indices].location, fields[indices].offset), ...);
		}(std::make_integer_sequence<int, field_count>{});
	}
};

}
