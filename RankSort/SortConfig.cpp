#include "pch.hpp"
#include "SortConfig.hpp"

#include <fstream>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace RankSort
{
    namespace
    {
        po::options_description describe_options()
        {
            po::options_description options("rank sort options");
            options.add_options()
                ("help,h", "print this message")
                ("max-value,m", po::value<data_t>(), "exclusive upper bound of the generated values")
                ("size,n", po::value<long long>(), "number of elements to sort")
                ("device,d", po::value<std::string>()->default_value("gpu"), "device kind: gpu, cpu or any")
                ("seed,s", po::value<unsigned>(), "random seed, drawn from the system when omitted")
                ("print-arrays", po::value<bool>()->default_value(true), "print the input and both sorted arrays")
                ("verify", po::value<bool>()->default_value(true), "fail when the device result differs from merge sort")
                ("verbosity,v", po::value<int>()->default_value(0), "glog verbose level")
                ("config,c", po::value<std::string>(), "ini style file with the same options")
                ;
            return options;
        }

        // unparsable input reads as 0
        data_t prompt_value(std::istream& in, std::ostream& out, const char* prompt)
        {
            out << prompt << std::endl;

            std::string line;
            std::getline(in, line);
            boost::algorithm::trim(line);

            data_t value = 0;
            if (!boost::conversion::try_lexical_convert(line, value))
            {
                value = 0;
            }
            return value;
        }
    }

    std::optional<SortOptions> ParseCommandLine(int argc, const char* const argv[])
    {
        auto description = describe_options();

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, description), vm);

        if (vm.count("config"))
        {
            auto path = vm["config"].as<std::string>();
            std::ifstream file(path);
            if (!file)
            {
                throw po::error("cannot open config file " + path);
            }
            // values already stored from the command line are kept
            po::store(po::parse_config_file(file, description), vm);
        }
        po::notify(vm);

        if (vm.count("help"))
        {
            return std::nullopt;
        }

        SortOptions options;
        if (vm.count("max-value"))
        {
            options.maxValue = vm["max-value"].as<data_t>();
            options.maxValueGiven = true;
        }
        if (vm.count("size"))
        {
            auto size = vm["size"].as<long long>();
            if (size < 0)
            {
                throw po::invalid_option_value(std::to_string(size));
            }
            options.arraySize = static_cast<std::size_t>(size);
            options.arraySizeGiven = true;
        }
        if (vm.count("seed"))
        {
            options.seed = vm["seed"].as<unsigned>();
            options.seedGiven = true;
        }
        options.device = ParseDeviceKind(vm["device"].as<std::string>());
        options.printArrays = vm["print-arrays"].as<bool>();
        options.verify = vm["verify"].as<bool>();
        options.verbosity = vm["verbosity"].as<int>();

        return options;
    }

    std::string Usage()
    {
        std::ostringstream out;
        out << describe_options();
        return out.str();
    }

    DeviceKind ParseDeviceKind(const std::string& name)
    {
        auto kind = boost::algorithm::to_lower_copy(name);
        if (kind == "gpu") return DeviceKind::Gpu;
        if (kind == "cpu") return DeviceKind::Cpu;
        if (kind == "any") return DeviceKind::Any;

        throw po::invalid_option_value(name);
    }

    void PromptForMissing(SortOptions& options, std::istream& in, std::ostream& out)
    {
        if (!options.maxValueGiven)
        {
            options.maxValue = prompt_value(in, out, "Choose an max value:");
            options.maxValueGiven = true;
        }

        if (!options.arraySizeGiven)
        {
            auto size = prompt_value(in, out, "Choose a array size:");
            if (size < 0)
            {
                throw std::invalid_argument("array size must not be negative");
            }
            options.arraySize = static_cast<std::size_t>(size);
            options.arraySizeGiven = true;
        }
    }

    std::vector<data_t> GenerateInput(std::size_t count, data_t maxValue, unsigned seed)
    {
        if (count == 0)
        {
            return {};
        }
        if (maxValue <= 0)
        {
            throw std::invalid_argument(
                (boost::format("max value must be positive, got %1%") % maxValue).str());
        }

        std::default_random_engine generator{ seed };
        std::uniform_int_distribution<data_t> distribution(0, maxValue - 1);

        std::vector<data_t> values(count);
        std::generate(values.begin(), values.end(), [&] { return distribution(generator); });
        return values;
    }
}
