#include "vector_math.hpp"
#include <cmath>
#include <cstring>

namespace clipmind {

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); i++) {
        dot    += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) return 0.0;

    return dot / (norm_a * norm_b);
}

double l2_norm(const Embedding& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * static_cast<double>(x);
    return std::sqrt(sum);
}

Embedding l2_normalize(const Embedding& v) {
    double norm = l2_norm(v);
    if (norm == 0.0) return v;
    Embedding out(v.size());
    for (size_t i = 0; i < v.size(); i++) {
        out[i] = static_cast<float>(static_cast<double>(v[i]) / norm);
    }
    return out;
}

Embedding mean_vector(const std::vector<const Embedding*>& vectors) {
    if (vectors.empty() || !vectors.front()) return {};
    size_t dim = vectors.front()->size();

    std::vector<double> sum(dim, 0.0);
    for (const Embedding* v : vectors) {
        if (!v || v->size() != dim) return {};
        for (size_t i = 0; i < dim; i++) sum[i] += (*v)[i];
    }

    Embedding mean(dim);
    auto n = static_cast<double>(vectors.size());
    for (size_t i = 0; i < dim; i++) {
        mean[i] = static_cast<float>(sum[i] / n);
    }
    return mean;
}

std::string serialize_vector(const Embedding& vec) {
    if (vec.empty()) return {};

    std::string data(sizeof(float) * vec.size(), '\0');
    std::memcpy(data.data(), vec.data(), sizeof(float) * vec.size());
    return data;
}

Embedding deserialize_vector(const std::string& data) {
    if (data.empty() || data.size() % sizeof(float) != 0) return {};

    Embedding vec(data.size() / sizeof(float));
    std::memcpy(vec.data(), data.data(), data.size());
    return vec;
}

} // namespace clipmind
