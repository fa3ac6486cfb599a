#pragma once

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

//!\brief An immutable weighted input unit, e.g. a small file and its size.
class item
{
private:
    //!\brief The identifier, expected (not required) to be unique within a run.
    std::string id_;

    //!\brief The strictly positive weight.
    double weight_;

public:
    /*!\brief Construct and validate an item.
     * \param[in] id_in the identifier of the item
     * \param[in] weight_in the weight of the item, must be > 0
     *
     * \throws std::invalid_argument if the weight is not a positive number
     */
    item(std::string id_in, double const weight_in) :
        id_{std::move(id_in)},
        weight_{weight_in}
    {
        if (!(weight_ > 0) || !std::isfinite(weight_))
        {
            std::stringstream ss;
            ss << "The weight of item '" << id_ << "' must be a positive number but is " << weight_in << '.';
            throw std::invalid_argument{ss.str()};
        }
    }

    std::string const & id() const noexcept
    {
        return id_;
    }

    double weight() const noexcept
    {
        return weight_;
    }

    bool operator==(item const & other) const = default;
};
