#include <gtest/gtest.h>
#include "dexview/AccessFlags.hpp"
#include "dexview/ClassDef.hpp"
#include "dexview/DexFile.hpp"
#include "dexview/Exceptions.hpp"
#include "DexImageBuilder.hpp"
#include <string>
#include <vector>

using namespace dexview;
using dexview::test::DexImageBuilder;

namespace {

    std::vector<std::string> names(const MemberList<Field>& fields) {
        std::vector<std::string> result;
        for (const Field& field : fields) {
            result.push_back(field.name());
        }
        return result;
    }

    std::vector<std::string> names(const MemberList<Method>& methods) {
        std::vector<std::string> result;
        for (const Method& method : methods) {
            result.push_back(method.name());
        }
        return result;
    }

} // namespace

TEST(ClassDef, ResolvesInterfaces) {
    DexImageBuilder builder;
    for (int i = 0; i < 5; ++i) {
        builder.addType("LFiller" + std::to_string(i) + ";");
    }
    uint32_t runnable = builder.addType("Ljava/lang/Runnable;");
    for (int i = 6; i < 9; ++i) {
        builder.addType("LFiller" + std::to_string(i) + ";");
    }
    uint32_t closeable = builder.addType("Ljava/io/Closeable;");
    uint32_t task = builder.addType("Lcom/example/Task;");
    ASSERT_EQ(runnable, 5u);
    ASSERT_EQ(closeable, 9u);

    uint32_t interfaces = builder.addTypeList({runnable, closeable});
    DexImageBuilder::ClassDefSpec spec;
    spec.classIndex = task;
    spec.interfacesOffset = interfaces;
    builder.addClassDef(spec);

    std::vector<uint8_t> image = builder.build();
    DexFile file(image);
    ClassDef classDef = file.classes().at(0);

    EXPECT_EQ(classDef.name(), "Lcom/example/Task;");
    FixedStrideList<std::string> list = classDef.interfaces();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list.at(0), "Ljava/lang/Runnable;");
    EXPECT_EQ(list.at(1), "Ljava/io/Closeable;");

    // Every call returns an independent, equal list
    EXPECT_EQ(classDef.interfaces().toVector(), list.toVector());
}

TEST(ClassDef, EagerHeaderFields) {
    DexImageBuilder builder;
    builder.addType("LPlaceholder;"); // type 0
    builder.addString("placeholder"); // string 1
    uint32_t object = builder.addType("Ljava/lang/Object;");
    uint32_t foo = builder.addType("Lcom/example/Foo;");
    uint32_t source = builder.addString("Foo.java");

    DexImageBuilder::ClassDefSpec spec;
    spec.classIndex = foo;
    spec.accessFlags = ACC_PUBLIC | ACC_FINAL;
    spec.superclassIndex = object;
    spec.sourceFileIndex = source;
    builder.addClassDef(spec);

    std::vector<uint8_t> image = builder.build();
    DexFile file(image);
    ClassDef classDef = file.classes().at(0);

    EXPECT_EQ(classDef.offset(), DexImageBuilder::kClassDefsOffset);
    EXPECT_EQ(classDef.accessFlags(), ACC_PUBLIC | ACC_FINAL);
    ASSERT_TRUE(classDef.superclass().has_value());
    EXPECT_EQ(*classDef.superclass(), "Ljava/lang/Object;");
    ASSERT_TRUE(classDef.sourceFile().has_value());
    EXPECT_EQ(*classDef.sourceFile(), "Foo.java");
}

TEST(ClassDef, AbsentSuperclassAndSourceFile) {
    DexImageBuilder builder;
    builder.addType("LPlaceholder;");
    uint32_t a = builder.addType("LA;");
    uint32_t b = builder.addType("LB;");

    // Index 0 and NO_INDEX both mean absent
    DexImageBuilder::ClassDefSpec zero;
    zero.classIndex = a;
    zero.superclassIndex = 0;
    zero.sourceFileIndex = 0;
    builder.addClassDef(zero);

    DexImageBuilder::ClassDefSpec none;
    none.classIndex = b;
    builder.addClassDef(none);

    std::vector<uint8_t> image = builder.build();
    DexFile file(image);

    for (const ClassDef classDef : file.classes()) {
        SCOPED_TRACE(classDef.name());
        EXPECT_FALSE(classDef.superclass().has_value());
        EXPECT_FALSE(classDef.sourceFile().has_value());
        EXPECT_TRUE(classDef.interfaces().empty());
        EXPECT_TRUE(classDef.annotations().empty());
    }
}

TEST(ClassDef, NoClassData) {
    DexImageBuilder builder;
    uint32_t marker = builder.addType("LMarker;");
    builder.addClassDef({marker, ACC_INTERFACE | ACC_ABSTRACT});
    std::vector<uint8_t> image = builder.build();
    DexFile file(image);
    ClassDef classDef = file.classes().at(0);

    EXPECT_EQ(classDef.classDataOffset(), 0u);
    EXPECT_EQ(classDef.staticFieldCount(), 0u);
    EXPECT_EQ(classDef.instanceFieldCount(), 0u);
    EXPECT_EQ(classDef.directMethodCount(), 0u);
    EXPECT_EQ(classDef.virtualMethodCount(), 0u);
    EXPECT_TRUE(classDef.fields().empty());
    EXPECT_TRUE(classDef.methods().empty());
}

TEST(ClassDef, FieldsAndMethodsResolveThroughIdTables) {
    DexImageBuilder builder;
    uint32_t count = builder.addField("Lcom/example/Foo;", "I", "count");
    uint32_t label = builder.addField("Lcom/example/Foo;", "Ljava/lang/String;", "label");
    uint32_t init = builder.addMethod("Lcom/example/Foo;", "V", {}, "<init>");
    uint32_t compute = builder.addMethod("Lcom/example/Foo;", "J", {"I", "[Ljava/lang/String;"}, "compute");
    uint32_t foo = builder.addType("Lcom/example/Foo;");

    DexImageBuilder::ClassDataSpec data;
    data.staticFields = {{count, ACC_STATIC}};
    data.instanceFields = {{label, ACC_PRIVATE}};
    data.directMethods = {{init, ACC_PUBLIC | ACC_CONSTRUCTOR, 0x200}};
    data.virtualMethods = {{compute, ACC_PUBLIC, 0x240}};
    uint32_t classData = builder.addClassData(data);

    DexImageBuilder::ClassDefSpec spec;
    spec.classIndex = foo;
    spec.classDataOffset = classData;
    builder.addClassDef(spec);

    std::vector<uint8_t> image = builder.build();
    DexFile file(image);
    ClassDef classDef = file.classes().at(0);

    EXPECT_EQ(classDef.staticFieldCount(), 1u);
    EXPECT_EQ(classDef.instanceFieldCount(), 1u);
    EXPECT_EQ(classDef.directMethodCount(), 1u);
    EXPECT_EQ(classDef.virtualMethodCount(), 1u);

    MemberList<Field> fields = classDef.fields();
    EXPECT_EQ(names(fields), (std::vector<std::string>{"count", "label"}));
    Field labelField = fields.at(1);
    EXPECT_EQ(labelField.type(), "Ljava/lang/String;");
    EXPECT_EQ(labelField.definingClass(), "Lcom/example/Foo;");
    EXPECT_FALSE(labelField.isStatic());
    EXPECT_TRUE(fields.at(0).isStatic());

    MemberList<Method> methods = classDef.methods();
    EXPECT_EQ(names(methods), (std::vector<std::string>{"<init>", "compute"}));
    EXPECT_EQ(methods.startOffset(), fields.endOffset());

    Method computeMethod = methods.at(1);
    EXPECT_EQ(computeMethod.returnType(), "J");
    EXPECT_EQ(computeMethod.definingClass(), "Lcom/example/Foo;");
    EXPECT_EQ(computeMethod.codeOffset(), 0x240u);
    EXPECT_EQ(computeMethod.parameterTypes().toVector(),
              (std::vector<std::string>{"I", "[Ljava/lang/String;"}));
    EXPECT_TRUE(methods.at(0).parameterTypes().empty());
    EXPECT_TRUE(computeMethod.annotations().empty());
    EXPECT_TRUE(computeMethod.parameterAnnotations().empty());
}

TEST(ClassDef, MethodsWithoutFields) {
    DexImageBuilder builder;
    uint32_t run = builder.addMethod("LJob;", "V", {}, "run");
    uint32_t job = builder.addType("LJob;");

    DexImageBuilder::ClassDataSpec data;
    data.virtualMethods = {{run, ACC_PUBLIC | ACC_ABSTRACT, 0}};
    uint32_t classData = builder.addClassData(data);
    builder.addClassDef({job, 0, NO_INDEX, 0, NO_INDEX, 0, classData, 0});

    std::vector<uint8_t> image = builder.build();
    DexFile file(image);
    ClassDef classDef = file.classes().at(0);

    EXPECT_TRUE(classDef.fields().empty());
    MemberList<Method> methods = classDef.methods();
    EXPECT_EQ(methods.startOffset(), classData + 4);
    ASSERT_EQ(methods.size(), 1u);
    EXPECT_EQ(methods.at(0).name(), "run");
    EXPECT_EQ(methods.at(0).codeOffset(), 0u);
}

TEST(ClassDef, StaticValuesShorterThanStatics) {
    DexImageBuilder builder;
    std::vector<uint32_t> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(builder.addField("LConstants;", "I", "K" + std::to_string(i)));
    }
    uint32_t instance = builder.addField("LConstants;", "I", "value");
    uint32_t constants = builder.addType("LConstants;");

    DexImageBuilder::ClassDataSpec data;
    data.staticFields = {{ids[0], ACC_STATIC}, {ids[1], ACC_STATIC}, {ids[2], ACC_STATIC}};
    data.instanceFields = {{instance, 0}};
    uint32_t classData = builder.addClassData(data);
    uint32_t values = builder.addEncodedArray({
        DexImageBuilder::encodedInt(7),
        DexImageBuilder::encodedBoolean(true),
    });
    builder.addClassDef({constants, 0, NO_INDEX, 0, NO_INDEX, 0, classData, values});

    std::vector<uint8_t> image = builder.build();
    DexFile file(image);
    std::vector<Field> fields = file.classes().at(0).fields().toVector();
    ASSERT_EQ(fields.size(), 4u);

    ASSERT_TRUE(fields[0].initialValue().has_value());
    EXPECT_EQ(fields[0].initialValue()->asLong(), 7);
    ASSERT_TRUE(fields[1].initialValue().has_value());
    EXPECT_TRUE(fields[1].initialValue()->booleanValue());
    EXPECT_FALSE(fields[2].initialValue().has_value());
    EXPECT_FALSE(fields[3].initialValue().has_value());
}

TEST(ClassDef, DeeplyNestedStaticValue) {
    DexImageBuilder builder;
    uint32_t table = builder.addField("LTable;", "[[I", "TABLE");
    uint32_t init = builder.addMethod("LTable;", "V", {}, "<clinit>");
    uint32_t type = builder.addType("LTable;");

    DexImageBuilder::ClassDataSpec data;
    data.staticFields = {{table, ACC_STATIC}};
    data.directMethods = {{init, ACC_STATIC | ACC_CONSTRUCTOR, 0}};
    uint32_t classData = builder.addClassData(data);

    // One static value: an array nested far past what the reader accepts
    std::vector<uint8_t> values = {0x01};
    for (int i = 0; i < 100000; ++i) {
        values.insert(values.end(), {0x1c, 0x01});
    }
    values.push_back(0x1e);
    uint32_t staticValues = builder.appendData(values);
    builder.addClassDef({type, 0, NO_INDEX, 0, NO_INDEX, 0, classData, staticValues});

    std::vector<uint8_t> image = builder.build();
    DexFile file(image);
    ClassDef classDef = file.classes().at(0);
    EXPECT_THROW(classDef.fields().toVector(), MalformedEncoding);
    EXPECT_THROW(classDef.methods(), MalformedEncoding);
}

TEST(ClassDef, MalformedClassDataHeader) {
    DexImageBuilder builder;
    uint32_t broken = builder.addType("LBroken;");
    uint32_t classData = builder.appendData({0x01, 0x00, 0x00});
    builder.addClassDef({broken, 0, NO_INDEX, 0, NO_INDEX, 0, classData, 0});

    // The fourth count runs off the end of the buffer
    std::vector<uint8_t> image = builder.build();
    DexFile file(image);
    ClassDef classDef = file.classes().at(0);
    EXPECT_THROW(classDef.fields(), MalformedEncoding);
    EXPECT_THROW(classDef.methods(), MalformedEncoding);
}

TEST(ClassDef, ClassDefPastEndOfBuffer) {
    DexImageBuilder builder;
    builder.addType("LA;");
    std::vector<uint8_t> image = builder.build();
    DexFile file(image);
    EXPECT_THROW(ClassDef(file, static_cast<uint32_t>(image.size() - 8)), MalformedEncoding);
}
