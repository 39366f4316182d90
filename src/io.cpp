#include <doctest/doctest.h>
#include "io.h"
#include "random.h"
#include <cmath>
#include <filesystem>
#include <map>
#include <random>
#include <sstream>
#include <spdlog/spdlog.h>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/all_of.hpp>

namespace Particula {

TrajectoryBase::Iterator::Iterator(TrajectoryBase* trajectory, size_t frame)
    : trajectory(trajectory)
    , frame(frame) {}

System TrajectoryBase::Iterator::operator*() const { return trajectory->read(static_cast<long>(frame)); }

TrajectoryBase::Iterator& TrajectoryBase::Iterator::operator++() {
    frame++;
    return *this;
}

TrajectoryBase::Iterator TrajectoryBase::Iterator::operator++(int) {
    auto copy = *this;
    frame++;
    return copy;
}

bool TrajectoryBase::Iterator::operator==(const Iterator& other) const {
    return trajectory == other.trajectory && frame == other.frame;
}

bool TrajectoryBase::Iterator::operator!=(const Iterator& other) const { return !(*this == other); }

/**
 * @throw std::out_of_range if the index does not refer to a frame
 */
size_t TrajectoryBase::normalizeIndex(const long index) const {
    const auto number_of_frames = static_cast<long>(size());
    const auto frame = index < 0 ? index + number_of_frames : index;
    if (frame < 0 || frame >= number_of_frames) {
        throw std::out_of_range(fmt::format("frame index {} out of range for {} frames", index, number_of_frames));
    }
    return static_cast<size_t>(frame);
}

const std::vector<long>& TrajectoryBase::steps() const { return frame_steps; }

std::vector<double> TrajectoryBase::times() const {
    std::vector<double> times;
    times.reserve(frame_steps.size());
    for (const auto step : frame_steps) {
        times.push_back(static_cast<double>(step) * timestep);
    }
    return times;
}

size_t TrajectoryBase::size() const { return frame_steps.size(); }

bool TrajectoryBase::empty() const { return frame_steps.empty(); }

void TrajectoryBase::write(const System& system, const long step) {
    saveFrame(system, step);
    frame_steps.push_back(step);
}

System TrajectoryBase::read(const long index) {
    auto system = loadFrame(normalizeIndex(index));
    for (auto& callback : callbacks) {
        callback(system);
    }
    return system;
}

System TrajectoryBase::operator[](const long index) { return read(index); }

void TrajectoryBase::addCallback(Callback callback) { callbacks.push_back(std::move(callback)); }

void TrajectoryBase::close() {}

TrajectoryBase::Iterator TrajectoryBase::begin() { return {this, 0}; }

TrajectoryBase::Iterator TrajectoryBase::end() { return {this, size()}; }

namespace {

constexpr auto null_value = "-"; //!< Placeholder for null values in text records

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

std::vector<std::string> splitList(const std::string& text, const char delimiter = ',') {
    std::vector<std::string> items;
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, delimiter)) {
        if (item.empty()) {
            throw std::invalid_argument(fmt::format("empty item in list '{}'", text));
        }
        items.push_back(item);
    }
    return items;
}

std::string joinList(const std::vector<std::string>& items, const std::string& delimiter) {
    std::string text;
    for (const auto& item : items) {
        if (!text.empty()) {
            text += delimiter;
        }
        text += item;
    }
    return text;
}

//! Strict string to double conversion; the whole token must be consumed
double parseDouble(const std::string& token) {
    size_t consumed = 0;
    const auto value = std::stod(token, &consumed);
    if (consumed != token.size()) {
        throw std::invalid_argument(fmt::format("cannot convert '{}' to a number", token));
    }
    return value;
}

long parseInteger(const std::string& token) {
    size_t consumed = 0;
    const auto value = std::stol(token, &consumed);
    if (consumed != token.size()) {
        throw std::invalid_argument(fmt::format("cannot convert '{}' to an integer", token));
    }
    return value;
}

std::string formatValue(const double value) { return fmt::format("{}", value); }

std::string formatValue(const std::optional<double>& value) { return value ? formatValue(*value) : null_value; }

//! Content of the metadata line of a frame
struct FrameHeader {
    std::optional<long> step;
    std::vector<std::string> columns; //!< Empty if not given
    std::optional<Cell> cell;
    std::optional<double> timestep;
};

/**
 * Words not of the form `key:value` and unknown keys are ignored.
 *
 * @throw std::exception if a known key has an invalid value
 */
FrameHeader parseHeader(const std::string& line) {
    FrameHeader header;
    for (const auto& word : splitWords(line)) {
        const auto colon = word.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const auto key = word.substr(0, colon);
        const auto value = word.substr(colon + 1);
        if (key == "step") {
            header.step = parseInteger(value);
        } else if (key == "columns") {
            header.columns = splitList(value);
        } else if (key == "cell") {
            const auto items = splitList(value);
            Point side(static_cast<Eigen::Index>(items.size()));
            for (size_t i = 0; i < items.size(); i++) {
                side[static_cast<Eigen::Index>(i)] = parseDouble(items[i]);
            }
            header.cell = Cell(side);
        } else if (key == "dt") {
            header.timestep = parseDouble(value);
        }
    }
    return header;
}

std::string formatHeader(const System& system, const long step, const std::vector<std::string>& fields,
                         const double timestep) {
    auto header = fmt::format("step:{} columns:{}", step, joinList(fields, ","));
    if (system.cell) {
        std::vector<std::string> sides;
        for (const auto side : system.cell->getSide()) {
            sides.push_back(formatValue(side));
        }
        header += " cell:" + joinList(sides, ",");
    }
    header += " dt:" + formatValue(timestep);
    return header;
}

/**
 * @brief Particle attribute held by a column of a particle line
 *
 * Besides the native names, the names used by other xyz writers are
 * understood: `id` and `name` for the species, `pos` and `vel` for the
 * vectors, and `x`, `y`, `z`, `vx`, `vy`, `vz` for single components.
 */
struct Column {
    enum class Kind { POSITION, VELOCITY, POSITION_COMPONENT, VELOCITY_COMPONENT, SPECIES, MASS, RADIUS, SITE, EXTRA };
    Kind kind = Kind::EXTRA;
    Eigen::Index component = 0; //!< Vector component of single component columns
    std::string name;           //!< Column name as given
    bool isVector() const { return kind == Kind::POSITION || kind == Kind::VELOCITY; }
};

Column parseColumn(const std::string& name) {
    using Kind = Column::Kind;
    static const std::map<std::string, Kind> named_kinds = {
        {"position", Kind::POSITION}, {"pos", Kind::POSITION},   {"velocity", Kind::VELOCITY},
        {"vel", Kind::VELOCITY},      {"species", Kind::SPECIES}, {"id", Kind::SPECIES},
        {"name", Kind::SPECIES},      {"mass", Kind::MASS},       {"radius", Kind::RADIUS},
        {"site", Kind::SITE}};
    static const std::string axes = "xyz";
    if (auto it = named_kinds.find(name); it != named_kinds.end()) {
        return {it->second, 0, name};
    }
    if (name.size() == 1 && axes.find(name[0]) != std::string::npos) {
        return {Kind::POSITION_COMPONENT, static_cast<Eigen::Index>(axes.find(name[0])), name};
    }
    if (name.size() == 2 && name[0] == 'v' && axes.find(name[1]) != std::string::npos) {
        return {Kind::VELOCITY_COMPONENT, static_cast<Eigen::Index>(axes.find(name[1])), name};
    }
    return {Kind::EXTRA, 0, name};
}

//! Columns of a particle line
struct Layout {
    std::vector<Column> columns;
    size_t vector_columns = 0;           //!< Number of `position` and `velocity` columns
    Eigen::Index number_of_components = 0; //!< Highest single component index plus one
};

/**
 * @throw std::invalid_argument if positions are given both as vector and as components
 */
Layout makeLayout(const std::vector<std::string>& names) {
    using Kind = Column::Kind;
    Layout layout;
    bool position_vector = false;
    bool position_components = false;
    for (const auto& name : names) {
        const auto column = parseColumn(name);
        if (column.isVector()) {
            layout.vector_columns++;
        }
        if (column.kind == Kind::POSITION_COMPONENT || column.kind == Kind::VELOCITY_COMPONENT) {
            layout.number_of_components = std::max(layout.number_of_components, column.component + 1);
        }
        position_vector = position_vector || column.kind == Kind::POSITION;
        position_components = position_components || column.kind == Kind::POSITION_COMPONENT;
        layout.columns.push_back(column);
    }
    if (position_vector && position_components) {
        throw std::invalid_argument(
            fmt::format("position given both as vector and as components in {}", joinList(names, ",")));
    }
    return layout;
}

/**
 * Number of dimensions of the particles on a line with `number_of_words`
 * words. Vector columns span one word per dimension, deduced from the word
 * count; otherwise single components or `default_dimension` decide.
 *
 * @throw std::invalid_argument if the words cannot be distributed over the columns
 */
Eigen::Index particleDimension(const Layout& layout, const size_t number_of_words,
                               const Eigen::Index default_dimension) {
    const auto scalar_columns = layout.columns.size() - layout.vector_columns;
    if (layout.vector_columns == 0) {
        if (number_of_words != scalar_columns) {
            throw std::invalid_argument(fmt::format("expected {} columns, got {}", scalar_columns, number_of_words));
        }
        return layout.number_of_components > 0 ? layout.number_of_components : default_dimension;
    }
    if (number_of_words <= scalar_columns || (number_of_words - scalar_columns) % layout.vector_columns != 0) {
        throw std::invalid_argument(fmt::format("{} columns do not match {} vector and {} scalar fields",
                                                number_of_words, layout.vector_columns, scalar_columns));
    }
    const auto dimension = static_cast<Eigen::Index>((number_of_words - scalar_columns) / layout.vector_columns);
    if (layout.number_of_components > dimension) {
        throw std::invalid_argument(
            fmt::format("component columns exceed the vector dimension {}", dimension));
    }
    return dimension;
}

std::optional<Point> parseVector(std::vector<std::string>::const_iterator& word, const Eigen::Index dimension) {
    if (ranges::all_of(word, word + dimension, [](const auto& value) { return value == null_value; })) {
        word += dimension;
        return std::nullopt;
    }
    Point vector(dimension);
    for (Eigen::Index d = 0; d < dimension; ++d) {
        vector[d] = parseDouble(*word++);
    }
    return vector;
}

Particle parseParticle(const std::vector<std::string>& words, const Layout& layout,
                       const Eigen::Index default_dimension) {
    using Kind = Column::Kind;
    const auto dimension = particleDimension(layout, words.size(), default_dimension);
    Particle particle(zeroPoint(dimension));
    auto word = words.cbegin();
    for (const auto& column : layout.columns) {
        if (column.kind == Kind::POSITION) {
            if (auto position = parseVector(word, dimension)) {
                particle.pos = *position;
            } else {
                throw std::invalid_argument("position cannot be null");
            }
            continue;
        }
        if (column.kind == Kind::VELOCITY) {
            particle.vel = parseVector(word, dimension);
            continue;
        }
        const auto& value = *word++;
        if (value == null_value) {
            if (column.kind == Kind::POSITION_COMPONENT) {
                throw std::invalid_argument("position cannot be null");
            }
            continue; // leave default
        }
        switch (column.kind) {
        case Kind::POSITION_COMPONENT:
            particle.pos[column.component] = parseDouble(value);
            break;
        case Kind::VELOCITY_COMPONENT:
            if (!particle.vel) {
                particle.vel = zeroPoint(dimension);
            }
            (*particle.vel)[column.component] = parseDouble(value);
            break;
        case Kind::SPECIES:
            particle.species = value;
            break;
        case Kind::MASS:
            particle.mass = parseDouble(value);
            break;
        case Kind::RADIUS:
            particle.radius = parseDouble(value);
            break;
        case Kind::SITE:
            particle.site = parseInteger(value);
            break;
        default:
            particle.extra[column.name] = parseDouble(value);
        }
    }
    return particle;
}

/**
 * @throw std::invalid_argument if a species label cannot be read back or a position component is missing
 */
std::string formatParticle(const Particle& particle, const Layout& layout) {
    using Kind = Column::Kind;
    std::vector<std::string> words;
    for (const auto& column : layout.columns) {
        switch (column.kind) {
        case Kind::POSITION:
            for (const auto x : particle.pos) {
                words.push_back(formatValue(x));
            }
            break;
        case Kind::VELOCITY:
            if (particle.vel) {
                for (const auto v : *particle.vel) {
                    words.push_back(formatValue(v));
                }
            } else {
                words.insert(words.end(), static_cast<size_t>(particle.pos.size()), null_value);
            }
            break;
        case Kind::POSITION_COMPONENT:
            if (column.component >= particle.pos.size()) {
                throw std::invalid_argument(fmt::format("no position component '{}'", column.name));
            }
            words.push_back(formatValue(particle.pos[column.component]));
            break;
        case Kind::VELOCITY_COMPONENT:
            if (particle.vel && column.component < particle.vel->size()) {
                words.push_back(formatValue((*particle.vel)[column.component]));
            } else {
                words.push_back(null_value);
            }
            break;
        case Kind::SPECIES:
            if (particle.species) {
                const auto& species = *particle.species;
                if (species.empty() || species == null_value || species.find_first_of(" \t\r\n") != std::string::npos) {
                    throw std::invalid_argument(fmt::format("invalid species label '{}'", species));
                }
                words.push_back(species);
            } else {
                words.push_back(null_value);
            }
            break;
        case Kind::MASS:
            words.push_back(formatValue(particle.mass));
            break;
        case Kind::RADIUS:
            words.push_back(formatValue(particle.radius));
            break;
        case Kind::SITE:
            words.push_back(particle.site ? std::to_string(*particle.site) : null_value);
            break;
        default:
            if (auto it = particle.extra.find(column.name); it != particle.extra.end()) {
                words.push_back(formatValue(it->second));
            } else {
                words.push_back(null_value);
            }
        }
    }
    return joinList(words, " ");
}

} // namespace

TrajectoryXYZ::TrajectoryXYZ(const std::string& filename, const Mode mode)
    : filename(filename)
    , mode(mode) {
    if (mode == Mode::WRITE) {
        output.open(filename, std::ios::out | std::ios::trunc);
        if (!output) {
            throw IOError("{}: cannot open trajectory for writing", filename);
        }
        particula_logger->debug("writing trajectory {}", filename);
    } else {
        input.open(filename);
        if (!input) {
            throw FormatError("{}: cannot open trajectory for reading", filename);
        }
        buildIndex();
        particula_logger->debug("read {} frame(s) from {}", size(), filename);
    }
}

TrajectoryXYZ::~TrajectoryXYZ() { close(); }

const std::string& TrajectoryXYZ::getFilename() const { return filename; }

void TrajectoryXYZ::close() {
    if (output.is_open()) {
        output.close();
    }
    if (input.is_open()) {
        input.close();
    }
}

/**
 * Scans the whole file once, validating the record framing and every value
 * on each particle line. Blank lines between records are skipped. The
 * `fields` and `timestep` of the first record are adopted if present.
 *
 * @throw FormatError naming file and line on malformed records
 */
void TrajectoryXYZ::buildIndex() {
    std::string line;
    size_t line_number = 0;
    auto next_line = [&]() -> bool {
        if (!std::getline(input, line)) {
            return false;
        }
        line_number++;
        return true;
    };
    while (true) {
        const auto offset = input.tellg();
        if (!next_line()) {
            break;
        }
        if (isBlank(line)) {
            continue;
        }
        const auto frame_line = line_number;
        size_t number_of_particles = 0;
        try {
            const auto count = parseInteger(splitWords(line).front());
            if (count < 0) {
                throw std::invalid_argument("negative count");
            }
            number_of_particles = static_cast<size_t>(count);
        } catch (const std::exception&) {
            throw FormatError("{}:{}: particle count expected", filename, line_number);
        }
        if (!next_line()) {
            throw FormatError("{}:{}: metadata line expected", filename, line_number + 1);
        }
        FrameHeader header;
        try {
            header = parseHeader(line);
        } catch (const std::exception& e) {
            throw FormatError("{}:{}: invalid metadata: {}", filename, line_number, e.what());
        }
        Layout layout;
        try {
            layout = makeLayout(header.columns.empty() ? fields : header.columns);
        } catch (const std::exception& e) {
            throw FormatError("{}:{}: invalid columns: {}", filename, line_number, e.what());
        }
        const auto default_dimension = header.cell ? header.cell->dimension() : 3;
        std::optional<size_t> number_of_words; // all lines in a frame must agree
        for (size_t i = 0; i < number_of_particles; i++) {
            if (!next_line()) {
                throw FormatError("{}:{}: truncated frame; expected {} particles, got {}", filename, line_number + 1,
                                  number_of_particles, i);
            }
            const auto words = splitWords(line);
            if (number_of_words && *number_of_words != words.size()) {
                throw FormatError("{}:{}: expected {} columns, got {}", filename, line_number, *number_of_words,
                                  words.size());
            }
            number_of_words = words.size();
            try {
                parseParticle(words, layout, default_dimension);
            } catch (const std::exception& e) {
                throw FormatError("{}:{}: {}", filename, line_number, e.what());
            }
        }
        if (frame_index.empty()) {
            if (!header.columns.empty()) {
                fields = header.columns;
            }
            if (header.timestep) {
                timestep = *header.timestep;
            }
        }
        frame_steps.push_back(header.step.value_or(static_cast<long>(frame_index.size())));
        frame_index.push_back({offset, frame_line});
    }
    input.clear(); // reset eof
}

/**
 * @throw IOError if not opened for reading
 * @throw FormatError naming file and line if a value cannot be converted
 */
System TrajectoryXYZ::loadFrame(const size_t frame) {
    if (mode != Mode::READ || !input.is_open()) {
        throw IOError("{}: trajectory not open for reading", filename);
    }
    const auto& [offset, first_line] = frame_index.at(frame);
    input.clear();
    input.seekg(offset);
    auto line_number = first_line;
    std::string line;
    try {
        std::getline(input, line);
        const auto number_of_particles = static_cast<size_t>(parseInteger(splitWords(line).front()));
        std::getline(input, line);
        line_number++;
        const auto header = parseHeader(line);
        const auto layout = makeLayout(header.columns.empty() ? fields : header.columns);
        System system;
        system.cell = header.cell;
        const auto default_dimension = system.cell ? system.cell->dimension() : 3;
        system.particles.reserve(number_of_particles);
        for (size_t i = 0; i < number_of_particles; i++) {
            if (!std::getline(input, line)) {
                throw std::runtime_error("unexpected end of file");
            }
            line_number++;
            system.particles.push_back(parseParticle(splitWords(line), layout, default_dimension));
        }
        return system;
    } catch (const std::exception& e) {
        throw FormatError("{}:{}: {}", filename, line_number, e.what());
    }
}

/**
 * The frame is formatted completely before anything is written, so that a
 * rejected frame leaves the file untouched.
 *
 * @throw IOError if not opened for writing, if a value cannot be written or if the stream fails
 */
void TrajectoryXYZ::saveFrame(const System& system, const long step) {
    if (mode != Mode::WRITE || !output.is_open()) {
        throw IOError("{}: trajectory not open for writing", filename);
    }
    std::string record = fmt::format("{}\n{}\n", system.size(), formatHeader(system, step, fields, timestep));
    try {
        const auto layout = makeLayout(fields);
        for (const auto& particle : system.particles) {
            record += formatParticle(particle, layout) + "\n";
        }
    } catch (const std::exception& e) {
        throw IOError("{}: cannot write frame at step {}: {}", filename, step, e.what());
    }
    output << record;
    output.flush();
    if (!output) {
        throw IOError("{}: error writing frame at step {}", filename, step);
    }
}

System TrajectoryRam::loadFrame(const size_t frame) { return frames.at(frame); }

void TrajectoryRam::saveFrame(const System& system, [[maybe_unused]] const long step) { frames.push_back(system); }

TrajectorySliced::TrajectorySliced(TrajectoryBase& source, const size_t start, const size_t stop,
                                   const size_t stride)
    : source(source) {
    if (stride == 0) {
        throw ConfigurationError("slice stride must be positive");
    }
    fields = source.fields;
    timestep = source.timestep;
    for (auto frame = start; frame < std::min(stop, source.size()); frame += stride) {
        source_frames.push_back(frame);
        frame_steps.push_back(source.steps().at(frame));
    }
}

System TrajectorySliced::loadFrame(const size_t frame) {
    return source.read(static_cast<long>(source_frames.at(frame)));
}

void TrajectorySliced::saveFrame([[maybe_unused]] const System& system, [[maybe_unused]] const long step) {
    throw IOError("sliced trajectory is read-only");
}

TrajectoryUnfolded::TrajectoryUnfolded(TrajectoryBase& source)
    : source(source) {
    fields = source.fields;
    timestep = source.timestep;
    frame_steps = source.steps();
}

/**
 * Advances `last_unfolded` by the minimum image displacements from
 * `last_folded` to `system`, then replaces the positions of `system`.
 *
 * @throw ConfigurationError if the frame has no cell or the number of particles changed
 */
void TrajectoryUnfolded::unfold(System& system) const {
    if (!system.cell) {
        throw ConfigurationError("cannot unfold frame without a cell");
    }
    if (system.size() != last_folded.size()) {
        throw ConfigurationError("cannot unfold frames with {} and {} particles", last_folded.size(), system.size());
    }
    for (size_t i = 0; i < system.size(); i++) {
        const auto& previous = last_folded.particles[i].pos;
        auto& particle = system.particles[i];
        const Point displacement = system.cell->vdist(particle.pos, previous);
        particle.pos = last_unfolded.particles[i].pos + displacement;
    }
}

System TrajectoryUnfolded::loadFrame(const size_t frame) {
    if (!last_frame || frame < *last_frame) {
        last_folded = source.read(0);
        last_unfolded = last_folded;
        last_frame = 0;
    }
    while (*last_frame < frame) {
        auto system = source.read(static_cast<long>(*last_frame + 1));
        auto folded = system;
        unfold(system);
        last_folded = std::move(folded);
        last_unfolded = std::move(system);
        ++*last_frame;
    }
    return last_unfolded;
}

void TrajectoryUnfolded::saveFrame([[maybe_unused]] const System& system, [[maybe_unused]] const long step) {
    throw IOError("unfolded trajectory is read-only");
}

void convert(TrajectoryBase& source, TrajectoryBase& destination) {
    destination.fields = source.fields;
    destination.timestep = source.timestep;
    for (size_t frame = 0; frame < source.size(); frame++) {
        destination.write(source.read(static_cast<long>(frame)), source.steps()[frame]);
    }
    particula_logger->debug("converted {} frame(s)", source.size());
}

/**
 * Intended for lattice models where the position column holds an integer
 * site index.
 *
 * @throw ConfigurationError if the first position coordinate is not integral
 */
TrajectoryBase::Callback makeLatticeSites() {
    return [](System& system) {
        for (auto& particle : system.particles) {
            if (particle.pos.size() == 0 || std::round(particle.pos[0]) != particle.pos[0]) {
                throw ConfigurationError("position is not an integer lattice site");
            }
            particle.site = std::lround(particle.pos[0]);
        }
    };
}

TrajectoryBase::Callback clearVelocities() {
    return [](System& system) {
        for (auto& particle : system.particles) {
            particle.vel.reset();
        }
    };
}

TEST_SUITE_BEGIN("IO");

namespace {
//! Temporary file removed when going out of scope
struct TemporaryFile {
    std::string name;
    explicit TemporaryFile(const std::string& basename)
        : name((std::filesystem::temp_directory_path() / fmt::format("{}-{}", std::random_device()(), basename))
                   .string()) {}
    ~TemporaryFile() {
        std::error_code error;
        std::filesystem::remove(name, error);
    }
    void write(const std::string& content) const { std::ofstream(name) << content; }
};

//! Message of the FormatError thrown when reading `filename`; empty if nothing is thrown
std::string formatErrorMessage(const std::string& filename) {
    try {
        TrajectoryXYZ trajectory(filename, TrajectoryXYZ::Mode::READ);
        for (const auto& system : trajectory) {
            static_cast<void>(system.size());
        }
    } catch (const FormatError& e) {
        return e.what();
    }
    return "";
}

System makeSystem(size_t number_of_particles, Random& random) {
    System system(ParticleVector(number_of_particles), Cell(5.0));
    for (auto& particle : system.particles) {
        particle.pos = system.cell->randomPosition(random);
        particle.species = "A";
    }
    return system;
}
} // namespace

TEST_CASE("[Particula] TrajectoryXYZ") {
    Random slump;
    TemporaryFile file("particula_trajectory_test.xyz");

    SUBCASE("four particles at step zero") {
        const auto system = makeSystem(4, slump);
        {
            TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::WRITE);
            trajectory.write(system, 0);
        }
        TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::READ);
        REQUIRE(trajectory.size() == 1);
        CHECK(trajectory.steps().front() == 0);
        const auto copy = trajectory[0];
        REQUIRE(copy.size() == 4);
        for (size_t i = 0; i < 4; i++) {
            CHECK(copy.particles[i].pos == system.particles[i].pos); // exact
            CHECK(copy.particles[i].species == system.particles[i].species);
            CHECK_FALSE(copy.particles[i].vel.has_value());
        }
        REQUIRE(copy.cell.has_value());
        CHECK(copy.cell->getSide() == system.cell->getSide());
    }

    SUBCASE("frames, steps and indexing") {
        const std::vector<long> written_steps = {0, 10, 20, 35, 100};
        {
            TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::WRITE);
            for (const auto step : written_steps) {
                trajectory.write(makeSystem(3, slump), step);
            }
            CHECK(trajectory.steps() == written_steps);
            CHECK_THROWS_AS(trajectory.read(0), IOError);
        }
        TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::READ);
        CHECK(trajectory.size() == written_steps.size());
        CHECK(trajectory.steps() == written_steps);
        CHECK(trajectory[-1].particles[2].pos == trajectory[4].particles[2].pos);
        CHECK(trajectory[-5].particles[0].pos == trajectory[0].particles[0].pos);
        CHECK_THROWS_AS(trajectory[5], std::out_of_range);
        CHECK_THROWS_AS(trajectory[-6], std::out_of_range);
        CHECK_THROWS_AS(trajectory.write(System(), 200), IOError);

        for (int pass = 0; pass < 2; pass++) { // iteration is restartable
            size_t count = 0;
            for (const auto& frame : trajectory) {
                CHECK(frame.size() == 3);
                count++;
            }
            CHECK(count == written_steps.size());
        }
    }

    SUBCASE("write mode truncates") {
        {
            TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::WRITE);
            trajectory.write(makeSystem(2, slump), 1);
            trajectory.write(makeSystem(2, slump), 2);
        }
        {
            TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::WRITE);
            trajectory.write(makeSystem(2, slump), 3);
        }
        TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::READ);
        CHECK(trajectory.steps() == std::vector<long>{3});
    }

    SUBCASE("file is released when scope exits on error") {
        try {
            TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::WRITE);
            trajectory.write(makeSystem(2, slump), 0);
            throw std::runtime_error("interrupted");
        } catch (const std::runtime_error& e) {
            CHECK(std::string(e.what()) == "interrupted");
        }
        TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::READ);
        CHECK(trajectory.size() == 1);
    }

    SUBCASE("optional fields and extra attributes") {
        System system = makeSystem(3, slump);
        system.particles[0].vel = Point::Constant(3, 0.1);
        system.particles[1].radius = 0.5;
        system.particles[1].species.reset();
        system.particles[2].extra["charge"] = -1.0;
        system.particles[2].mass = 2.5;
        {
            TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::WRITE);
            trajectory.fields = {"species", "position", "velocity", "mass", "radius", "charge"};
            trajectory.timestep = 0.002;
            trajectory.write(system, 7);
        }
        TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::READ);
        CHECK(trajectory.fields.size() == 6); // adopted from file
        CHECK(trajectory.timestep == 0.002);
        const auto copy = trajectory[0];
        CHECK(*copy.particles[0].vel == *system.particles[0].vel);
        CHECK_FALSE(copy.particles[1].vel.has_value());
        CHECK(*copy.particles[1].radius == 0.5);
        CHECK_FALSE(copy.particles[1].species.has_value());
        CHECK_FALSE(copy.particles[0].radius.has_value());
        CHECK(copy.particles[2].extra.at("charge") == -1.0);
        CHECK(copy.particles[2].mass == 2.5);
        CHECK(copy.particles[0].extra.empty());
    }

    SUBCASE("callbacks in registration order") {
        System system = makeSystem(2, slump);
        for (auto& particle : system.particles) {
            particle.maxwellian(1.0, slump);
        }
        {
            TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::WRITE);
            trajectory.fields = {"position", "velocity"};
            trajectory.write(system, 0);
        }
        TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::READ);
        trajectory.addCallback([](System& s) { s.particles[0].mass = 2.0; });
        trajectory.addCallback([](System& s) { s.particles[0].mass *= 3.0; });
        trajectory.addCallback(clearVelocities());
        const auto copy = trajectory[0];
        CHECK(copy.particles[0].mass == 6.0);
        CHECK_FALSE(copy.particles[0].vel.has_value());
        CHECK_FALSE(copy.particles[1].vel.has_value());
    }

    SUBCASE("lattice sites and header without columns") {
        file.write("2\nstep:7\nA 3\nB -1\n\n2\nstep:9\nA 4\nB 0\n");
        TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::READ);
        CHECK(trajectory.steps() == std::vector<long>{7, 9});
        trajectory.addCallback(makeLatticeSites());
        const auto last = trajectory[-1];
        CHECK(last.particles[0].pos.size() == 1);
        CHECK(*last.particles[0].site == 4);
        CHECK(*last.particles[1].site == 0);
        CHECK(*last.particles[1].species == "B");
    }

    SUBCASE("component columns and species aliases") {
        file.write("2\ncolumns:id,x,y,z step:1 cell:5.0,5.0,5.0\nB 1.0 -1.0 0.0\nA 2.9 -2.9 0.0\n"
                   "2\ncolumns:id,x,y,z step:2 cell:5.0,5.0,5.0\nC 1.0 -1.0 0.0\nB 2.9 -2.9 0.0\n");
        TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::READ);
        CHECK(trajectory.steps() == std::vector<long>{1, 2});
        const auto first = trajectory[0];
        REQUIRE(first.size() == 2);
        CHECK(*first.particles[0].species == "B");
        CHECK(first.particles[1].pos == Point(Eigen::Vector3d(2.9, -2.9, 0.0)));
        CHECK(first.particles[1].extra.empty());
        CHECK(*trajectory[1].particles[0].species == "C");

        file.write("1\ncolumns:x,y,vx,vy step:0\n0.5 1.5 -1 -\n");
        TrajectoryXYZ planar(file.name, TrajectoryXYZ::Mode::READ);
        const auto particle = planar[0].particles.front();
        CHECK(particle.pos == Point(Eigen::Vector2d(0.5, 1.5)));
        REQUIRE(particle.vel.has_value());
        CHECK(*particle.vel == Point(Eigen::Vector2d(-1.0, 0.0)));
        CHECK(particle.extra.empty());
    }

    SUBCASE("species labels that cannot be read back") {
        for (const std::string label : {"A B", "-", ""}) {
            System system = makeSystem(2, slump);
            system.particles[1].species = label;
            TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::WRITE);
            CHECK_THROWS_AS(trajectory.write(system, 0), IOError);
            CHECK(trajectory.empty());
        }
        TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::READ);
        CHECK(trajectory.empty()); // nothing of the rejected frame was written
    }

    SUBCASE("convert and times") {
        {
            TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::WRITE);
            trajectory.timestep = 0.5;
            trajectory.write(makeSystem(3, slump), 10);
            trajectory.write(makeSystem(3, slump), 20);
        }
        TrajectoryXYZ source(file.name, TrajectoryXYZ::Mode::READ);
        CHECK(source.times() == std::vector<double>{5.0, 10.0});
        TrajectoryRam copy;
        convert(source, copy);
        CHECK(copy.timestep == 0.5);
        CHECK(copy.steps() == source.steps());
        CHECK(copy.fields == source.fields);
        CHECK(copy[1].particles[2].pos == source[1].particles[2].pos);

        TemporaryFile other("particula_converted.xyz");
        {
            TrajectoryXYZ destination(other.name, TrajectoryXYZ::Mode::WRITE);
            convert(copy, destination);
        }
        TrajectoryXYZ converted(other.name, TrajectoryXYZ::Mode::READ);
        CHECK(converted.timestep == 0.5);
        CHECK(converted.steps() == std::vector<long>{10, 20});
        CHECK(converted[0].particles[0].pos == source[0].particles[0].pos);
    }

    SUBCASE("missing and malformed files") {
        CHECK_THROWS_AS(TrajectoryXYZ("/nonexistent/particula.xyz", TrajectoryXYZ::Mode::READ), FormatError);
        CHECK_THROWS_AS(TrajectoryXYZ("/nonexistent/particula.xyz", TrajectoryXYZ::Mode::WRITE), IOError);

        file.write("two\nstep:0\nA 0 0 0\nA 1 1 1\n");
        auto message = formatErrorMessage(file.name);
        CHECK(message.find(file.name + ":1:") != std::string::npos);

        file.write("3\nstep:0\nA 0 0 0\nA 1 1 1\n");
        message = formatErrorMessage(file.name);
        CHECK(message.find(":5:") != std::string::npos);
        CHECK(message.find("truncated") != std::string::npos);

        file.write("2\nstep:0 columns:species,position\nA 0 0 0\nA 1 1\n");
        message = formatErrorMessage(file.name);
        CHECK(message.find(":4:") != std::string::npos);

        file.write("2\nstep:zero\nA 0 0 0\nA 1 1 1\n");
        message = formatErrorMessage(file.name);
        CHECK(message.find(":2:") != std::string::npos);

        file.write("2\nstep:0\nA 0 0 0\nA 1 x 1\n");
        CHECK_THROWS_AS(TrajectoryXYZ(file.name, TrajectoryXYZ::Mode::READ), FormatError); // detected on open
        message = formatErrorMessage(file.name);
        CHECK(message.find(":4:") != std::string::npos);

        file.write("1\nstep:0 columns:species,x,position\nA 0 0 0 0\n");
        message = formatErrorMessage(file.name);
        CHECK(message.find(":2:") != std::string::npos);

        file.write("");
        CHECK(formatErrorMessage(file.name).empty());
        TrajectoryXYZ trajectory(file.name, TrajectoryXYZ::Mode::READ);
        CHECK(trajectory.empty());
    }
}

TEST_CASE("[Particula] TrajectoryRam") {
    Random slump;
    TrajectoryRam trajectory;
    auto system = makeSystem(3, slump);
    trajectory.write(system, 0);
    system.particles.clear();
    trajectory.write(system, 5);
    CHECK(trajectory.steps() == std::vector<long>{0, 5});
    CHECK(trajectory[0].size() == 3); // deep copy
    CHECK(trajectory[-1].size() == 0);

    auto copy = trajectory[0];
    copy.particles.pop_back();
    CHECK(trajectory[0].size() == 3);

    trajectory.addCallback([](System& s) { s.particles.push_back(Particle()); });
    CHECK(trajectory[0].size() == 4);
    CHECK_THROWS_AS(trajectory[2], std::out_of_range);
}

TEST_CASE("[Particula] TrajectorySliced") {
    TrajectoryRam trajectory;
    trajectory.timestep = 0.1;
    for (long step = 0; step < 5; step++) {
        trajectory.write(System(ParticleVector(static_cast<size_t>(step + 1))), step * 10);
    }
    TrajectorySliced every_other(trajectory, 0, 5, 2);
    CHECK(every_other.steps() == std::vector<long>{0, 20, 40});
    CHECK(every_other[-1].size() == 5);
    CHECK(every_other.timestep == 0.1);

    TrajectorySliced tail(trajectory, 3, 100);
    CHECK(tail.steps() == std::vector<long>{30, 40});
    CHECK(tail[0].size() == 4);
    CHECK_THROWS_AS(tail.write(System(), 50), IOError);
    CHECK(TrajectorySliced(trajectory, 6, 10).empty());
    CHECK_THROWS_AS(TrajectorySliced(trajectory, 0, 5, 0), ConfigurationError);
}

TEST_CASE("[Particula] TrajectoryUnfolded") {
    TrajectoryRam folded;
    for (const double x : {4.5, -4.5, -3.5, -2.0}) { // moves +1, +1, +1.5 in a cell of side 10
        Particle particle;
        particle.pos.x() = x;
        folded.write(System(ParticleVector{particle}, Cell(10.0)), 0);
    }
    TrajectoryUnfolded unfolded(folded);
    CHECK(unfolded.size() == 4);
    CHECK(unfolded[2].particles[0].pos.x() == doctest::Approx(6.5));
    CHECK(unfolded[-1].particles[0].pos.x() == doctest::Approx(8.0));
    CHECK(unfolded[0].particles[0].pos.x() == doctest::Approx(4.5)); // restarts from the first frame
    CHECK(unfolded[1].particles[0].pos.x() == doctest::Approx(5.5));
    CHECK(unfolded[3].meanSquareDisplacement(unfolded[0]) == doctest::Approx(3.5 * 3.5));
    CHECK(folded[3].meanSquareDisplacement(folded[0]) == doctest::Approx(6.5 * 6.5));
    CHECK_THROWS_AS(unfolded.write(System(), 0), IOError);

    TrajectoryRam unbounded;
    unbounded.write(System(ParticleVector(1)), 0);
    unbounded.write(System(ParticleVector(1)), 1);
    TrajectoryUnfolded cannot_unfold(unbounded);
    CHECK_THROWS_AS(cannot_unfold[1], ConfigurationError);
}

TEST_SUITE_END();

} // namespace Particula
