/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __UWFRAC_TREE_H
#define __UWFRAC_TREE_H 1

#include <string>
#include <vector>
#include <stdint.h>

namespace uw {
    class BPTree {
        public:
            /* tracked attributes, indexed by the opening parenthesis of a node */
            std::vector<double> lengths;
            std::vector<std::string> names;

            /* total number of parentheses */
            uint32_t nparens;

            /* default constructor
             *
             * @param newick A newick string
             */
            BPTree(std::string newick);
            ~BPTree();

            /* postorder tree traversal
             *
             * Get the index position of the ith node in a postorder tree
             * traversal.
             *
             * @param i The ith node in a postorder traversal
             */
            uint32_t postorderselect(uint32_t i) const;

            /* preorder tree traversal
             *
             * Get the index position of the ith node in a preorder tree
             * traversal.
             *
             * @param i The ith node in a preorder traversal
             */
            uint32_t preorderselect(uint32_t i) const;

            /* Test if the node at an index position is a leaf
             *
             * @param i The node to evaluate
             */
            bool isleaf(uint32_t i) const;

            /* Get the parent of a node, -1 for the root
             *
             * @param i The node to obtain the parent of
             */
            int32_t parent(uint32_t i) const;

            /* number of nodes, root included */
            uint32_t n_nodes() const { return nparens / 2; }

            /* false if the newick could not be matched into a tree, or has a non-finite length */
            bool is_valid() const { return valid; }

            /* get the names at the tips of the tree, in preorder */
            std::vector<std::string> get_tip_names() const;

            /* public getters */
            std::vector<bool> get_structure() const;
            std::vector<uint32_t> get_openclose() const;

        private:
            std::vector<bool> structure;          // the topology
            std::vector<uint32_t> openclose;      // cache'd mapping between parentheses
            std::vector<int32_t> parents;         // cache'd parent of each opening parenthesis
            std::vector<uint32_t> select_0_index; // cache of select 0
            std::vector<uint32_t> select_1_index; // cache of select 1
            bool valid;

            void index_and_cache();  // construct the select caches
            void newick_to_bp(const std::string &newick);  // convert a newick string to parentheses
            void newick_to_metadata(std::string newick);  // convert newick to attributes
            bool structure_to_openclose();  // set the cache mapping between parentheses pairs, and parents
            void set_node_metadata(unsigned int open_idx, std::string &token, std::string::size_type unquoted_from); // set attributes for a node
            bool is_structure_character(char c) const;  // test if a character is a newick structure
            inline uint32_t open(uint32_t i) const;  // obtain the index of the opening for a given parenthesis
            std::string tokenize(std::string::iterator &start, const std::string::iterator &end,
                                 std::string::size_type &unquoted_from);  // newick -> tokens, and where the last quote closed
    };
}

#endif /* __UWFRAC_TREE_H */
