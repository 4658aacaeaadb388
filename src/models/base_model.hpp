#ifndef BASE_MODEL_HPP
#define BASE_MODEL_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// Raised by weight-file loaders. ModelManager catches it and degrades.
class ModelLoadError : public std::runtime_error {
public:
  explicit ModelLoadError(const std::string &what)
      : std::runtime_error(what) {}
};

// Abstract base class for every admission classifier
class IAdmissionModel {
public:
  virtual ~IAdmissionModel() = default;

  // Probability that the page is productive for the mission, in [0, 1].
  // Throws std::invalid_argument when the vector has the wrong length.
  virtual double predict_probability(const std::vector<double> &features) = 0;

  virtual size_t input_size() const = 0;

  // Short backend name for statistics and logs
  virtual std::string kind() const = 0;
};

#endif // BASE_MODEL_HPP
