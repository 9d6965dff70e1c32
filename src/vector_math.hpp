#pragma once
#include "item.hpp"
#include <string>
#include <vector>

namespace clipmind {

// Cosine similarity in [-1, 1]. Returns 0.0 if either vector is empty,
// zero-magnitude, or the lengths differ.
double cosine_similarity(const Embedding& a, const Embedding& b);

double l2_norm(const Embedding& v);

// Scale to unit length. Zero vectors are returned unchanged.
Embedding l2_normalize(const Embedding& v);

// Element-wise mean. Empty input or mismatched lengths yield an empty vector.
Embedding mean_vector(const std::vector<const Embedding*>& vectors);

// Serialize a float vector to a binary string (for DB storage).
std::string serialize_vector(const Embedding& vec);

// Deserialize a binary string back to a float vector.
Embedding deserialize_vector(const std::string& data);

} // namespace clipmind
