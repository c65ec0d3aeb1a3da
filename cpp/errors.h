#ifndef errors_h
#define errors_h

#include <stdexcept>
#include <string>

// Base of all errors raised by the analysis core.
// The core never catches these; the batch runner decides what to do with a failed dataset.
class AnalysisError : public std::runtime_error
{
public:
	explicit AnalysisError(const std::string& msg) : std::runtime_error(msg) {}
};

// Zero-length sample array, or no signal left to compute a ratio from
class EmptyInputError : public AnalysisError
{
public:
	explicit EmptyInputError(const std::string& msg) : AnalysisError(msg) {}
};

// Peak search exhausted the profile
class NoPeakFoundError : public AnalysisError
{
public:
	explicit NoPeakFoundError(const std::string& msg) : AnalysisError(msg) {}
};

// Two operands expected to share a voxel grid do not
class ShapeMismatchError : public AnalysisError
{
public:
	explicit ShapeMismatchError(const std::string& msg) : AnalysisError(msg) {}
};

// Statistics requested over an empty or too small object population
class InsufficientDataError : public AnalysisError
{
public:
	explicit InsufficientDataError(const std::string& msg) : AnalysisError(msg) {}
};

#endif
