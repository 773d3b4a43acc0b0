#pragma once
#ifndef SFNET_ERRORS_HPP
#define SFNET_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sfnet {

//! base of all errors raised by mutations and lookups of a Graph
class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DuplicateNodeError : public GraphError {
public:
    using GraphError::GraphError;
};

class NodeNotFoundError : public GraphError {
public:
    using GraphError::GraphError;
};

class DuplicateEdgeError : public GraphError {
public:
    using GraphError::GraphError;
};

class MissingEdgeError : public GraphError {
public:
    using GraphError::GraphError;
};

class SelfEdgeNotAllowedError : public GraphError {
public:
    using GraphError::GraphError;
};

//! negative or infeasible parameters of generators and statistics
class InvalidParameterError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

//! statistics requested on an empty sequence
class EmptyInputError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}

#endif // SFNET_ERRORS_HPP
