#include "rotorlink/assembler.hpp"
#include "rotorlink/logger.hpp"
#include <limits>
#include <stdexcept>

namespace rotorlink {

Assembler::Assembler(CouplingDofModel model, int num_nodes)
    : model_(model), num_nodes_(num_nodes) {
    if (num_nodes < 2) {
        throw std::invalid_argument("Assembler: A rotor needs at least two nodes");
    }
    if (num_nodes > std::numeric_limits<int>::max() / rotorlink::dofs_per_node(model)) {
        throw std::invalid_argument("Assembler: Too many nodes for int DOF indices");
    }
}

void Assembler::number_elements(const std::vector<CouplingElement*>& elements) {
    for (size_t i = 0; i < elements.size(); ++i) {
        if (!elements[i]->n().has_value()) {
            elements[i]->set_element_number(static_cast<int>(i));
        }
    }
}

RotorlinkError Assembler::check_elements(const std::vector<CouplingElement*>& elements) const {
    if (elements.empty()) {
        return RotorlinkError::empty_assembly();
    }

    for (size_t i = 0; i < elements.size(); ++i) {
        const CouplingElement& elem = *elements[i];

        if (!elem.n().has_value()) {
            return RotorlinkError::unnumbered_element(static_cast<int>(i));
        }

        if (elem.dof_model() != model_) {
            return RotorlinkError::dof_model_mismatch(*elem.n(), model_name(model_),
                                                      model_name(elem.dof_model()));
        }

        if (*elem.n_r() >= num_nodes_) {
            return RotorlinkError::invalid_node(*elem.n(), *elem.n_r(), num_nodes_);
        }
    }

    return RotorlinkError();
}

std::vector<int> Assembler::get_location_array(const CouplingElement& element) const {
    if (!element.n().has_value()) {
        throw std::runtime_error("Assembler: " + RotorlinkError::unnumbered_element(-1).to_string());
    }
    if (*element.n_r() >= num_nodes_) {
        throw std::runtime_error("Assembler: " +
            RotorlinkError::invalid_node(*element.n(), *element.n_r(), num_nodes_).to_string());
    }

    const int per_node = element.dofs_per_node();
    const int first = *element.n_l() * per_node;

    // Left and right nodes are consecutive, so their DOFs are too
    std::vector<int> loc(element.num_dofs());
    for (int i = 0; i < element.num_dofs(); ++i) {
        loc[i] = first + i;
    }
    return loc;
}

Eigen::SparseMatrix<double> Assembler::assemble(
    const std::vector<CouplingElement*>& elements, MatrixKind kind) const {

    RotorlinkError err = check_elements(elements);
    if (err.is_error()) {
        throw std::runtime_error("Assembler: " + err.to_string());
    }

    if (kind == MatrixKind::Stiffening && model_ != CouplingDofModel::SixDoF) {
        throw std::logic_error("Assembler: Stiffening matrix is only defined for the 6-DOF model");
    }

    const int n_total = total_dofs();
    Eigen::SparseMatrix<double> A_global(n_total, n_total);

    std::vector<Eigen::Triplet<double>> triplets;
    // At most two entries per row of each element matrix
    triplets.reserve(elements.size() * 2 * num_element_dofs(model_));

    for (const auto* elem : elements) {
        Eigen::MatrixXd A_elem = elem->matrix(kind);
        std::vector<int> loc_array = get_location_array(*elem);
        add_element_matrix(triplets, A_elem, loc_array);
    }

    // Duplicates (shared nodes) are summed
    A_global.setFromTriplets(triplets.begin(), triplets.end());

    ROTORLINK_LOG_DEBUG("Assembled {} elements into {}x{} matrix ({} non-zeros)",
                        elements.size(), n_total, n_total, A_global.nonZeros());

    return A_global;
}

Eigen::SparseMatrix<double> Assembler::assemble_mass(
    const std::vector<CouplingElement*>& elements) const {
    return assemble(elements, MatrixKind::Mass);
}

Eigen::SparseMatrix<double> Assembler::assemble_stiffness(
    const std::vector<CouplingElement*>& elements) const {
    return assemble(elements, MatrixKind::Stiffness);
}

Eigen::SparseMatrix<double> Assembler::assemble_damping(
    const std::vector<CouplingElement*>& elements) const {
    return assemble(elements, MatrixKind::Damping);
}

Eigen::SparseMatrix<double> Assembler::assemble_gyroscopic(
    const std::vector<CouplingElement*>& elements) const {
    return assemble(elements, MatrixKind::Gyroscopic);
}

Eigen::SparseMatrix<double> Assembler::assemble_stiffening(
    const std::vector<CouplingElement*>& elements) const {
    return assemble(elements, MatrixKind::Stiffening);
}

double Assembler::compute_total_mass(const std::vector<CouplingElement*>& elements) const {
    double total_mass = 0.0;
    for (const auto* elem : elements) {
        total_mass += elem->total_mass();
    }
    return total_mass;
}

void Assembler::add_element_matrix(
    std::vector<Eigen::Triplet<double>>& triplets,
    const Eigen::MatrixXd& element_matrix,
    const std::vector<int>& loc_array) const {

    const int n = static_cast<int>(loc_array.size());

    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            double value = element_matrix(i, j);
            if (value != 0.0) {
                triplets.emplace_back(loc_array[i], loc_array[j], value);
            }
        }
    }
}

} // namespace rotorlink
