// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

class Component {
protected:
    ~Component () {};

public:
    typedef std::vector<Component *> List;
    virtual void begin () { }
    virtual void process () { }
    virtual void end () { }
};

// -----------------------------------------------------------------------------------------------

class Diagnosticable {
protected:
    ~Diagnosticable () {};

public:
    virtual void collectDiagnostics (JsonVariant &) const = 0;
};

class DiagnosticablesManager : public Component {
public:
    typedef struct {
        const char *section;    // nests the collection under obj [section] when set
    } Config;

    using List = std::vector<Diagnosticable *>;

private:
    const Config &config;
    const List _diagnosticables;

public:
    DiagnosticablesManager (const Config &cfg, const List &diagnosticables) :
        config (cfg),
        _diagnosticables (diagnosticables) { }
    void collect (JsonVariant &obj) const {
        JsonVariant sub = (config.section != nullptr) ? obj [config.section].to<JsonVariant> () : obj;
        for (const auto &diagnosticable : _diagnosticables)
            diagnosticable->collectDiagnostics (sub);
    }
    size_t size () const {
        return _diagnosticables.size ();
    }
};

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
