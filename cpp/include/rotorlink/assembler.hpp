#pragma once

#include <Eigen/Sparse>
#include <vector>
#include "rotorlink/coupling_element.hpp"
#include "rotorlink/errors.hpp"

namespace rotorlink {

/**
 * @brief Assembles rotor matrices from coupling element matrices
 *
 * Nodes are numbered 0 .. num_nodes - 1 along the shaft. Node i owns
 * global DOFs [i * dofs_per_node, (i + 1) * dofs_per_node), in the local
 * DOF order of the model. An element numbered n connects nodes n and n + 1.
 *
 * Uses triplet lists; contributions of elements sharing a node are summed.
 */
class Assembler {
public:
    /**
     * @brief Construct an assembler
     * @param model DOF model of every element to be assembled
     * @param num_nodes Number of rotor nodes
     * @throws std::invalid_argument if num_nodes < 2 or the DOF count
     *         would not fit in an int
     */
    Assembler(CouplingDofModel model, int num_nodes);

    /**
     * @brief Number unnumbered elements by their position in the list
     *
     * Elements that already have an element number keep it.
     */
    static void number_elements(const std::vector<CouplingElement*>& elements);

    /**
     * @brief Check that elements can be assembled
     * @return OK, or the first problem found (empty list, unnumbered element,
     *         DOF model mismatch, node outside the rotor)
     */
    RotorlinkError check_elements(const std::vector<CouplingElement*>& elements) const;

    /**
     * @brief Get location array for an element
     * @return Global DOF index for each element DOF
     * @throws std::runtime_error if the element has no element number or
     *         its right node is outside the rotor
     */
    std::vector<int> get_location_array(const CouplingElement& element) const;

    /**
     * @brief Assemble global mass matrix (total_dofs × total_dofs)
     * @throws std::runtime_error if check_elements() reports an error
     */
    Eigen::SparseMatrix<double> assemble_mass(
        const std::vector<CouplingElement*>& elements) const;

    Eigen::SparseMatrix<double> assemble_stiffness(
        const std::vector<CouplingElement*>& elements) const;

    Eigen::SparseMatrix<double> assemble_damping(
        const std::vector<CouplingElement*>& elements) const;

    Eigen::SparseMatrix<double> assemble_gyroscopic(
        const std::vector<CouplingElement*>& elements) const;

    /**
     * @brief Assemble global stiffening matrix (6-DOF model only)
     * @throws std::logic_error for the 4-DOF model
     */
    Eigen::SparseMatrix<double> assemble_stiffening(
        const std::vector<CouplingElement*>& elements) const;

    /**
     * @brief Generic assembly by matrix kind
     */
    Eigen::SparseMatrix<double> assemble(
        const std::vector<CouplingElement*>& elements, MatrixKind kind) const;

    /**
     * @brief Sum of all station masses
     */
    double compute_total_mass(const std::vector<CouplingElement*>& elements) const;

    int total_dofs() const { return num_nodes_ * rotorlink::dofs_per_node(model_); }
    int num_nodes() const { return num_nodes_; }
    CouplingDofModel dof_model() const { return model_; }

private:
    CouplingDofModel model_;
    int num_nodes_;

    /**
     * @brief Add element matrix to triplet list
     *
     * For each non-zero entry K_e(i,j), adds triplet (loc[i], loc[j], K_e(i,j))
     */
    void add_element_matrix(
        std::vector<Eigen::Triplet<double>>& triplets,
        const Eigen::MatrixXd& element_matrix,
        const std::vector<int>& loc_array) const;
};

} // namespace rotorlink
