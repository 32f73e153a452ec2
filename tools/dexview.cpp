/**
 * @file dexview.cpp
 * @brief Command line listing of the classes in a dex file.
 *
 * Usage: dexview <file.dex> [class-descriptor]
 *
 * Exit codes: 0 on success or after printing help, 1 on usage errors,
 * 2 when the container or a record cannot be decoded or the requested
 * class is not defined.
 */

#include "dexview/DexView.hpp"
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace
{
    struct Options
    {
        std::string path;
        std::optional<std::string> descriptor;
        bool help = false;
    };

    const char* kUsage = "Usage: dexview <file.dex> [class-descriptor]";

    Options parseArguments(int argc, char** argv)
    {
        Options options;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help")
            {
                options.help = true;
                return options;
            }
            if (!arg.empty() && arg[0] == '-')
            {
                throw std::invalid_argument("Unknown option: " + arg);
            }

            if (options.path.empty())
            {
                options.path = arg;
            }
            else if (!options.descriptor)
            {
                options.descriptor = arg;
            }
            else
            {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
        }

        if (options.path.empty())
        {
            throw std::invalid_argument(kUsage);
        }
        return options;
    }

    std::string describeValue(const dexview::EncodedValue& value)
    {
        using dexview::ValueType;

        std::ostringstream out;
        switch (value.type())
        {
            case ValueType::Null:
                out << "null";
                break;
            case ValueType::Boolean:
                out << (value.booleanValue() ? "true" : "false");
                break;
            case ValueType::Byte:
            case ValueType::Short:
            case ValueType::Int:
            case ValueType::Long:
                out << value.asLong();
                break;
            case ValueType::Char:
                out << "char 0x" << std::hex << value.bits();
                break;
            case ValueType::Float:
            case ValueType::Double:
                out << "bits 0x" << std::hex << value.bits();
                break;
            case ValueType::Array:
                out << "<array>";
                break;
            case ValueType::Annotation:
                out << "<annotation>";
                break;
            default:
                out << "<ref " << std::dec << value.bits() << ">";
                break;
        }
        return out.str();
    }

    void printAnnotations(const dexview::AnnotationSet& annotations, const char* indent)
    {
        for (const dexview::Annotation annotation : annotations)
        {
            std::cout << indent << "@" << annotation.type() << "\n";
        }
    }

    void printClass(const dexview::ClassDef& classDef)
    {
        using namespace dexview;

        std::cout << "class " << classDef.name();
        std::string flags = formatAccessFlags(classDef.accessFlags(), FlagTarget::Class);
        if (!flags.empty()) std::cout << " [" << flags << "]";
        std::cout << "\n";

        if (classDef.superclass()) std::cout << "  extends " << *classDef.superclass() << "\n";
        for (const std::string iface : classDef.interfaces())
        {
            std::cout << "  implements " << iface << "\n";
        }
        if (classDef.sourceFile()) std::cout << "  source " << *classDef.sourceFile() << "\n";
        printAnnotations(classDef.annotations(), "  ");

        for (const Field& field : classDef.fields())
        {
            std::cout << "  field #" << field.index() << " " << field.name()
                      << ":" << field.type();
            std::string fieldFlags = formatAccessFlags(field.accessFlags(), FlagTarget::Field);
            if (!fieldFlags.empty()) std::cout << " [" << fieldFlags << "]";
            if (field.initialValue()) std::cout << " = " << describeValue(*field.initialValue());
            std::cout << "\n";
            printAnnotations(field.annotations(), "    ");
        }

        for (const Method& method : classDef.methods())
        {
            std::cout << "  method #" << method.index() << " " << method.name() << "(";
            bool first = true;
            for (const std::string parameter : method.parameterTypes())
            {
                if (!first) std::cout << ", ";
                std::cout << parameter;
                first = false;
            }
            std::cout << ")" << method.returnType();
            std::string methodFlags = formatAccessFlags(method.accessFlags(), FlagTarget::Method);
            if (!methodFlags.empty()) std::cout << " [" << methodFlags << "]";
            if (method.codeOffset() != 0)
            {
                std::cout << " code@0x" << std::hex << method.codeOffset() << std::dec;
            }
            std::cout << "\n";
            printAnnotations(method.annotations(), "    ");
        }
    }
}

int main(int argc, char** argv)
{
    Options options;
    try
    {
        options = parseArguments(argc, argv);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }

    if (options.help)
    {
        std::cout << kUsage << "\n";
        return 0;
    }

    try
    {
        dexview::DexFile file(options.path);

        if (options.descriptor)
        {
            auto classDef = file.findClass(*options.descriptor);
            if (!classDef)
            {
                std::cerr << "dexview: error: class " << *options.descriptor
                          << " is not defined in " << options.path << "\n";
                return 2;
            }
            printClass(*classDef);
            return 0;
        }

        std::cout << options.path << ": dex version " << std::setw(3) << std::setfill('0')
                  << file.version() << std::setfill(' ') << ", " << file.classCount()
                  << " classes\n";
        for (const dexview::ClassDef classDef : file.classes())
        {
            printClass(classDef);
        }
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "dexview: error: " << e.what() << "\n";
        return 2;
    }
}
