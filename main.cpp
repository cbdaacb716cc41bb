/******************************************************************************
 * Copyright (C) 2016 Kitsune Ral <kitsune-ral@users.sf.net>
 * Copyright (C) 2026 insogen contributors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 */

#include "analyzer.h"
#include "printer.h"

#include <QtCore/QCoreApplication>
#include <QtCore/QCommandLineParser>

#include <filesystem>
#include <fstream>
#include <iostream>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("insogen");
    QCoreApplication::setApplicationVersion("0.1");

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main",
        "Insomnia collection generator for Swagger 2.0 API descriptions"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configPathOption("config",
        QCoreApplication::translate("main", "Generator configuration in YAML format"),
        "configfile");
    parser.addOption(configPathOption);

    QCommandLineOption outputFileOption("out",
        QCoreApplication::translate("main",
            "Write the collection to <outputfile> instead of the standard output"),
        "outputfile");
    parser.addOption(outputFileOption);

    QCommandLineOption messagesOption("messages",
        QCoreApplication::translate("main",
            "Configure the verbosity, one of: quiet, basic, and debug"),
        "verbosity", "basic");
    parser.addOption(messagesOption);

    parser.addPositionalArgument("file",
        QCoreApplication::translate("main",
            "Swagger 2.0 API description in JSON or YAML format"
            " (data/world-api-stillness.json by default)"),
        "[file]");

    parser.process(app);

    try {
        using namespace std;
        namespace fs = filesystem;

        const auto& verbosityArg = parser.value(messagesOption);
        const auto verbosity = verbosityArg == "quiet"   ? Verbosity::Quiet
                               : verbosityArg == "debug" ? Verbosity::Debug
                                                         : Verbosity::Basic;
        const auto& configPath = parser.value(configPathOption);
        const auto config = configPath.isEmpty()
                                ? Config(verbosity)
                                : Config(configPath.toStdString(), verbosity);

        const auto& pathArgs = parser.positionalArguments();
        if (pathArgs.size() > 1)
            throw Exception("Only one input file can be converted at a time");
        const fs::path inputPath = pathArgs.isEmpty() ? "data/world-api-stillness.json"
                                                      : pathArgs.front().toStdString();

        const auto model = Analyzer(verbosity).loadModel(inputPath);
        const auto collection = Printer(config).print(model);

        if (const auto& outPath = parser.value(outputFileOption); !outPath.isEmpty()) {
            ofstream outFile(outPath.toStdString(), ios::binary);
            if (!(outFile << collection).flush())
                throw Exception("Cannot write to " + outPath.toStdString());
            if (verbosity != Verbosity::Quiet)
                clog << "Collection written to " << outPath.toStdString() << endl;
        } else
            cout << collection << flush;
    }
    catch (MissingInputDocument& e)
    {
        std::cerr << "Error: " << e.message << std::endl;
        return 1;
    }
    catch (Exception& e)
    {
        std::cerr << e.message << std::endl;
        return 3;
    }
    catch (std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 3;
    }

    return 0;
}
